// Copyright (c) 2025, optrust Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef OPTRUST_UTIL_STRING_HPP
#define OPTRUST_UTIL_STRING_HPP

#include <array>
#include <string>
#include <string_view>

namespace optrust::util
{
    [[nodiscard]] auto is_space(char c) -> bool;
    [[nodiscard]] auto is_digit(char c) -> bool;

    /**
     * Return true for `[0-9a-f]`, upper case hexadecimal digits are rejected.
     */
    [[nodiscard]] auto is_lower_hex(char c) -> bool;

    [[nodiscard]] auto to_lower(char c) -> char;
    [[nodiscard]] auto to_lower(std::string_view str) -> std::string;

    /**
     * Split a string in a prefix and the rest if the prefix is found, otherwise the
     * prefix is empty.
     */
    [[nodiscard]] auto split_prefix(std::string_view str, std::string_view::value_type c)
        -> std::array<std::string_view, 2>;

    /**
     * Remove a single occurrence of the character at the start of the string, if any.
     */
    [[nodiscard]] auto remove_prefix(std::string_view str, std::string_view::value_type c)
        -> std::string_view;

    /**
     * Remove leading and trailing whitespaces.
     */
    [[nodiscard]] auto strip(std::string_view input) -> std::string_view;

    /**
     * Join the elements of a range of string-like objects with the given separator.
     */
    template <typename Range>
    [[nodiscard]] auto join(std::string_view sep, const Range& container) -> std::string;

    /********************
     *  Implementation  *
     ********************/

    template <typename Range>
    auto join(std::string_view sep, const Range& container) -> std::string
    {
        auto out = std::string();
        bool first = true;
        for (const auto& elem : container)
        {
            if (!first)
            {
                out += sep;
            }
            out += elem;
            first = false;
        }
        return out;
    }
}
#endif

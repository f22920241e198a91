// Copyright (c) 2025, optrust Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>

#include "optrust/util/string.hpp"

namespace optrust::util
{
    auto is_space(char c) -> bool
    {
        return (c == ' ') || (c == '\t') || (c == '\n') || (c == '\v') || (c == '\f')
               || (c == '\r');
    }

    auto is_digit(char c) -> bool
    {
        return ('0' <= c) && (c <= '9');
    }

    auto is_lower_hex(char c) -> bool
    {
        return is_digit(c) || (('a' <= c) && (c <= 'f'));
    }

    auto to_lower(char c) -> char
    {
        if (('A' <= c) && (c <= 'Z'))
        {
            return static_cast<char>(c - 'A' + 'a');
        }
        return c;
    }

    auto to_lower(std::string_view str) -> std::string
    {
        auto out = std::string(str);
        std::transform(out.cbegin(), out.cend(), out.begin(), [](char c) { return to_lower(c); });
        return out;
    }

    auto split_prefix(std::string_view str, std::string_view::value_type c)
        -> std::array<std::string_view, 2>
    {
        if (!str.empty() && str.front() == c)
        {
            return { str.substr(0, 1), str.substr(1) };
        }
        return { std::string_view(), str };
    }

    auto remove_prefix(std::string_view str, std::string_view::value_type c) -> std::string_view
    {
        return std::get<1>(split_prefix(str, c));
    }

    auto strip(std::string_view input) -> std::string_view
    {
        const auto start = std::find_if_not(input.cbegin(), input.cend(), is_space);
        if (start == input.cend())
        {
            return {};
        }
        const auto rstart = std::find_if_not(input.crbegin(), input.crend(), is_space);
        const auto first = static_cast<std::size_t>(start - input.cbegin());
        const auto last = input.size() - static_cast<std::size_t>(rstart - input.crbegin());
        return input.substr(first, last - first);
    }
}

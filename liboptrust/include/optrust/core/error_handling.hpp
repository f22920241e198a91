// Copyright (c) 2025, optrust Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef OPTRUST_CORE_ERROR_HANDLING_HPP
#define OPTRUST_CORE_ERROR_HANDLING_HPP

#include <any>
#include <stdexcept>
#include <string>

#include <tl/expected.hpp>

namespace optrust
{

    /***********************
     * optrust exceptions *
     ***********************/

    enum class optrust_error_code
    {
        unknown,
        unsupported_platform,
        unsupported_version,
        registry_validation,
        registry_read,
        registry_parse,
        registry_write,
        configuration,
        digest_mismatch,
        file_read,
        incorrect_usage
    };

    class optrust_error : public std::runtime_error
    {
    public:

        using base_type = std::runtime_error;

        optrust_error(const std::string& msg, optrust_error_code ec);
        optrust_error(const char* msg, optrust_error_code ec);
        optrust_error(const std::string& msg, optrust_error_code ec, std::any&& data);
        optrust_error(const char* msg, optrust_error_code ec, std::any&& data);

        optrust_error_code error_code() const noexcept;
        const std::any& data() const noexcept;

    private:

        optrust_error_code m_error_code;
        std::any m_data;
    };

    template <class T, class E = optrust_error>
    using expected_t = tl::expected<T, E>;

    /********************
     * helper functions *
     ********************/

    tl::unexpected<optrust_error> make_unexpected(const char* msg, optrust_error_code ec);

    tl::unexpected<optrust_error> make_unexpected(const std::string& msg, optrust_error_code ec);

    tl::unexpected<optrust_error>
    make_unexpected(const std::string& msg, optrust_error_code ec, std::any&& data);

    template <class T, class E>
    tl::unexpected<E> forward_error(const tl::expected<T, E>& exp);

    template <class T, class E>
    T& extract(tl::expected<T, E>& exp);

    template <class T, class E>
    const T& extract(const tl::expected<T, E>& exp);

    template <class T, class E>
    T&& extract(tl::expected<T, E>&& exp);

    /***********************************
     * helper functions implementation *
     ***********************************/

    template <class T, class E>
    tl::unexpected<E> forward_error(const tl::expected<T, E>& exp)
    {
        return tl::make_unexpected(exp.error());
    }

    namespace detail
    {
        template <class T>
        decltype(auto) extract_impl(T&& exp)
        {
            if (exp)
            {
                return std::forward<T>(exp).value();
            }
            else
            {
                throw exp.error();
            }
        }
    }

    template <class T, class E>
    T& extract(tl::expected<T, E>& exp)
    {
        return detail::extract_impl(exp);
    }

    template <class T, class E>
    const T& extract(const tl::expected<T, E>& exp)
    {
        return detail::extract_impl(exp);
    }

    template <class T, class E>
    T&& extract(tl::expected<T, E>&& exp)
    {
        return detail::extract_impl(std::move(exp));
    }

}

#endif

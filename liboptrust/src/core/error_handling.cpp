// Copyright (c) 2025, optrust Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include "optrust/core/error_handling.hpp"

namespace optrust
{
    optrust_error::optrust_error(const std::string& msg, optrust_error_code ec)
        : base_type(msg)
        , m_error_code(ec)
    {
    }

    optrust_error::optrust_error(const char* msg, optrust_error_code ec)
        : base_type(msg)
        , m_error_code(ec)
    {
    }

    optrust_error::optrust_error(const std::string& msg, optrust_error_code ec, std::any&& data)
        : base_type(msg)
        , m_error_code(ec)
        , m_data(std::move(data))
    {
    }

    optrust_error::optrust_error(const char* msg, optrust_error_code ec, std::any&& data)
        : base_type(msg)
        , m_error_code(ec)
        , m_data(std::move(data))
    {
    }

    optrust_error_code optrust_error::error_code() const noexcept
    {
        return m_error_code;
    }

    const std::any& optrust_error::data() const noexcept
    {
        return m_data;
    }

    tl::unexpected<optrust_error> make_unexpected(const char* msg, optrust_error_code ec)
    {
        return tl::make_unexpected(optrust_error(msg, ec));
    }

    tl::unexpected<optrust_error> make_unexpected(const std::string& msg, optrust_error_code ec)
    {
        return tl::make_unexpected(optrust_error(msg, ec));
    }

    tl::unexpected<optrust_error>
    make_unexpected(const std::string& msg, optrust_error_code ec, std::any&& data)
    {
        return tl::make_unexpected(optrust_error(msg, ec, std::move(data)));
    }
}

// Copyright (c) 2025, optrust Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <any>
#include <cerrno>
#include <fstream>
#include <stdexcept>
#include <system_error>

#include <fmt/format.h>

#include "optrust/core/logging.hpp"
#include "optrust/util/cryptography.hpp"
#include "optrust/util/string.hpp"
#include "optrust/validation/tools.hpp"

namespace optrust::validation
{
    auto DigestMismatchError::get_details(const optrust_error& error) -> const DigestMismatchError&
    {
        return std::any_cast<const DigestMismatchError&>(error.data());
    }

    auto sha256sum(const fs::path& path) -> expected_t<std::string>
    {
        std::error_code ec;
        if (!fs::is_regular_file(path, ec))
        {
            return make_unexpected(
                fmt::format("failed to hash '{}': not a regular file", path.string()),
                optrust_error_code::file_read
            );
        }

        std::ifstream infile(path, std::ios::in | std::ios::binary);
        if (!infile)
        {
            return make_unexpected(
                fmt::format(
                    "failed to open '{}': {}",
                    path.string(),
                    std::error_code(errno, std::generic_category()).message()
                ),
                optrust_error_code::file_read
            );
        }

        try
        {
            auto hasher = util::Sha256Hasher();
            return hasher.file_hex_str(infile);
        }
        catch (const std::runtime_error& err)
        {
            return make_unexpected(
                fmt::format("failed to hash '{}': {}", path.string(), err.what()),
                optrust_error_code::file_read
            );
        }
    }

    auto verify_sha256(const fs::path& path, std::string_view expected) -> expected_t<void>
    {
        auto actual = sha256sum(path);
        if (!actual)
        {
            return forward_error(actual);
        }

        auto expected_lower = util::to_lower(util::strip(expected));
        if (*actual != expected_lower)
        {
            auto message = fmt::format(
                "SHA-256 mismatch for '{}': expected {}, got {}",
                path.string(),
                expected_lower,
                *actual
            );
            return make_unexpected(
                message,
                optrust_error_code::digest_mismatch,
                DigestMismatchError{ std::move(expected_lower), std::move(actual).value() }
            );
        }

        LOG_DEBUG << "SHA-256 of '" << path.string() << "' verified";
        return {};
    }
}

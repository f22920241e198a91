// Copyright (c) 2025, optrust Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef OPTRUST_VALIDATION_TOOLS_HPP
#define OPTRUST_VALIDATION_TOOLS_HPP

#include <string>
#include <string_view>

#include "optrust/core/error_handling.hpp"
#include "optrust/fs/filesystem.hpp"

namespace optrust::validation
{
    /**
     * Details attached to an `optrust_error` with code `digest_mismatch`.
     */
    struct DigestMismatchError
    {
        std::string expected;
        std::string actual;

        static auto get_details(const optrust_error& error) -> const DigestMismatchError&;
    };

    /**
     * Compute the SHA-256 digest of a file, in lowercase hexadecimal encoding.
     */
    [[nodiscard]] auto sha256sum(const fs::path& path) -> expected_t<std::string>;

    /**
     * Check that the SHA-256 digest of a file is the expected one.
     *
     * The expected digest is compared case insensitively.
     * A different digest fails with a `digest_mismatch` error carrying both digests.
     */
    [[nodiscard]] auto verify_sha256(const fs::path& path, std::string_view expected)
        -> expected_t<void>;
}
#endif

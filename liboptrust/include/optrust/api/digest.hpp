// Copyright (c) 2025, optrust Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef OPTRUST_API_DIGEST_HPP
#define OPTRUST_API_DIGEST_HPP

#include <string>
#include <string_view>

#include "optrust/core/context.hpp"
#include "optrust/core/error_handling.hpp"
#include "optrust/fs/filesystem.hpp"

namespace optrust
{
    /**
     * Resolve the trusted SHA-256 digest of a tool version for the platform of the context.
     *
     * The registry is located, bootstrapped if needed, loaded and validated before the lookup.
     * Fails with:
     * - `unsupported_platform` if the context platform is not supported;
     * - `unsupported_version` if the registry has no digest for the version on that platform;
     * - the error of the failing step otherwise.
     */
    [[nodiscard]] auto expected_digest_for_version(const Context& ctx, std::string_view version)
        -> expected_t<std::string>;

    /**
     * Same as above using the process environment and the build host platform.
     */
    [[nodiscard]] auto expected_digest_for_current_platform(std::string_view version)
        -> expected_t<std::string>;

    /**
     * Check a binary against the trusted digest of its version.
     */
    [[nodiscard]] auto
    verify_binary(const Context& ctx, const fs::path& binary_path, std::string_view version)
        -> expected_t<void>;

    /**
     * Same as above using the process environment and the build host platform.
     */
    [[nodiscard]] auto
    verify_binary_for_current_platform(const fs::path& binary_path, std::string_view version)
        -> expected_t<void>;
}
#endif

// Copyright (c) 2025, optrust Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <fmt/format.h>

#include "optrust/api/digest.hpp"
#include "optrust/core/logging.hpp"
#include "optrust/registry/registry.hpp"
#include "optrust/registry/store.hpp"
#include "optrust/specs/platform.hpp"
#include "optrust/validation/tools.hpp"

namespace optrust
{
    auto expected_digest_for_version(const Context& ctx, std::string_view version)
        -> expected_t<std::string>
    {
        auto registry = registry::load_or_bootstrap_registry(ctx.registry_params);
        if (!registry)
        {
            return forward_error(registry);
        }

        const auto& platform = ctx.platform_params;
        auto key = specs::resolve_platform_key(platform.os, platform.arch);
        if (!key)
        {
            return forward_error(key);
        }

        auto digest = registry::get_expected_digest(*registry, version, *key);
        if (!digest)
        {
            return make_unexpected(
                fmt::format(
                    "unsupported 1Password CLI version: {} (no checksum for {})",
                    registry::normalize_version(version),
                    specs::platform_key_name(*key)
                ),
                optrust_error_code::unsupported_version
            );
        }

        LOG_DEBUG << "Expected SHA-256 for version " << registry::normalize_version(version)
                  << " on " << specs::platform_key_name(*key) << " is " << *digest;
        return std::move(digest).value();
    }

    auto expected_digest_for_current_platform(std::string_view version) -> expected_t<std::string>
    {
        return expected_digest_for_version(Context::from_environment(), version);
    }

    auto verify_binary(const Context& ctx, const fs::path& binary_path, std::string_view version)
        -> expected_t<void>
    {
        auto digest = expected_digest_for_version(ctx, version);
        if (!digest)
        {
            return forward_error(digest);
        }
        return validation::verify_sha256(binary_path, *digest);
    }

    auto verify_binary_for_current_platform(const fs::path& binary_path, std::string_view version)
        -> expected_t<void>
    {
        return verify_binary(Context::from_environment(), binary_path, version);
    }
}

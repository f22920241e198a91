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
#include "optrust/util/string.hpp"

#include "optrust.hpp"

using namespace optrust;  // NOLINT(build/namespaces)

namespace
{
    auto digest_for_platform_key(const Context& ctx, std::string_view version, std::string_view key_name)
        -> expected_t<std::string>
    {
        const auto key = specs::platform_key_parse(key_name);
        if (!key)
        {
            return make_unexpected(
                fmt::format(
                    "unknown platform key '{}' (expected one of: {})",
                    key_name,
                    util::join(", ", specs::known_platform_key_names())
                ),
                optrust_error_code::incorrect_usage
            );
        }

        auto registry = registry::load_or_bootstrap_registry(ctx.registry_params);
        if (!registry)
        {
            return forward_error(registry);
        }

        if (auto digest = registry::get_expected_digest(*registry, version, *key))
        {
            return std::move(digest).value();
        }
        return make_unexpected(
            fmt::format(
                "unsupported 1Password CLI version: {} (no checksum for {})",
                registry::normalize_version(version),
                key_name
            ),
            optrust_error_code::unsupported_version
        );
    }
}

void
set_digest_command(CLI::App* subcom, const CommonOptions& options, Context& ctx)
{
    static std::string version;
    static std::string platform;

    subcom->add_option("version", version, "1Password CLI version, like 2.31.1")->required();
    subcom->add_option("--platform", platform, "Platform key (default: the current platform)")
        ->type_name("KEY");

    subcom->callback(
        [&]()
        {
            apply_common_options(options, ctx);

            const auto digest = platform.empty()
                                    ? extract(expected_digest_for_version(ctx, version))
                                    : extract(digest_for_platform_key(ctx, version, platform));
            fmt::print("{}\n", digest);
        }
    );
}

void
set_verify_command(CLI::App* subcom, const CommonOptions& options, Context& ctx)
{
    static std::string version;
    static std::string file;

    subcom->add_option("version", version, "1Password CLI version, like 2.31.1")->required();
    subcom->add_option("file", file, "Binary to verify")->required()->type_name("FILE");

    subcom->callback(
        [&]()
        {
            apply_common_options(options, ctx);

            verify_binary(ctx, file, version)
                .or_else([](optrust_error&& error) { throw std::move(error); });
            fmt::print("{}: OK\n", file);
        }
    );
}

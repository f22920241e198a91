// Copyright (c) 2025, optrust Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <fmt/format.h>

#include "optrust/core/logging.hpp"
#include "optrust/registry/loader.hpp"
#include "optrust/registry/store.hpp"
#include "optrust/registry/validation.hpp"

#include "optrust.hpp"

using namespace optrust;  // NOLINT(build/namespaces)

void
set_path_command(CLI::App* subcom, const CommonOptions& options, Context& ctx)
{
    subcom->callback(
        [&]()
        {
            apply_common_options(options, ctx);

            const auto location = extract(registry::resolve_registry_path(ctx.registry_params));
            fmt::print(
                "{} ({})\n",
                location.path.string(),
                location.is_override ? "override" : "default"
            );
        }
    );
}

namespace
{
    auto load_for_validation(const Context& ctx, const fs::path& file) -> expected_t<registry::Registry>
    {
        if (!file.empty())
        {
            return registry::read_registry(file);
        }
        return registry::load_or_bootstrap_registry(ctx.registry_params);
    }

    void print_violations(const optrust_error& error)
    {
        const auto& details = registry::RegistryValidationError::get_details(error);
        for (const auto& violation : details.violations)
        {
            LOG_ERROR << violation.message;
        }
    }
}

void
set_validate_command(CLI::App* subcom, const CommonOptions& options, Context& ctx)
{
    static std::string file;
    subcom->add_option("file", file, "Registry file to validate (default: the resolved registry)")
        ->type_name("FILE");

    subcom->callback(
        [&]()
        {
            apply_common_options(options, ctx);

            auto registry = load_for_validation(ctx, file);
            if (!registry)
            {
                if (registry.error().error_code() == optrust_error_code::registry_validation)
                {
                    print_violations(registry.error());
                }
                throw registry.error();
            }

            const auto name = file.empty()
                                  ? extract(registry::resolve_registry_path(ctx.registry_params)).path
                                  : fs::path(file);
            fmt::print(
                "{}: valid (schema_version {}, {} version(s))\n",
                name.string(),
                registry->schema_version,
                registry->versions.size()
            );
        }
    );
}

void
set_bootstrap_command(CLI::App* subcom, const CommonOptions& options, Context& ctx)
{
    subcom->callback(
        [&]()
        {
            apply_common_options(options, ctx);

            const auto path = extract(registry::default_registry_path(ctx.registry_params));
            const bool written = extract(registry::bootstrap_registry_if_missing(path));
            if (written)
            {
                fmt::print("Installed bundled versions registry at {}\n", path.string());
            }
            else
            {
                fmt::print("Versions registry already present at {}\n", path.string());
            }
        }
    );
}

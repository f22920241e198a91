// Copyright (c) 2025, optrust Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include "optrust/core/logging.hpp"

#include "common_options.hpp"

using namespace optrust;  // NOLINT(build/namespaces)

namespace
{
    auto verbosity_to_log_level(int verbosity) -> log_level
    {
        switch (verbosity)
        {
            case 0:
                return log_level::warn;
            case 1:
                return log_level::info;
            case 2:
                return log_level::debug;
            default:
                return log_level::trace;
        }
    }
}

void
init_common_options(CLI::App* com, CommonOptions& options)
{
    std::string cli_group = "Global options";

    com->add_flag(
           "-v,--verbose",
           options.verbosity,
           "Set verbosity (higher verbosity with multiple -v, e.g. -vvv)"
    )
        ->group(cli_group);

    com->add_option(
           "--registry",
           options.registry_file,
           "Path to the versions registry, takes precedence over "
               + std::string(registry_path_env_var)
    )
        ->type_name("FILE")
        ->group(cli_group);
}

void
apply_common_options(const CommonOptions& options, Context& ctx)
{
    ctx.logging_params.logging_level = verbosity_to_log_level(options.verbosity);
    if (!options.registry_file.empty())
    {
        ctx.registry_params.override_path = options.registry_file;
    }
    logging::start_logging(ctx.logging_params);
    LOG_DEBUG << "Log level set to " << name_of(ctx.logging_params.logging_level);
}

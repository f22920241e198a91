// Copyright (c) 2025, optrust Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <exception>
#include <iostream>
#include <optional>
#include <string>

#include <CLI/CLI.hpp>

#include "optrust/core/context.hpp"
#include "optrust/core/logging.hpp"

#include "optrust.hpp"
#include "version.hpp"

using namespace optrust;  // NOLINT(build/namespaces)

int
main(int argc, char** argv)
{
    auto ctx = Context::from_environment();
    CommonOptions options;

    CLI::App app{ "Trusted checksums of the 1Password CLI\nVersion: " + optrust_cli::version()
                  + "\n" };
    set_optrust_command(&app, options, ctx);

    std::optional<std::string> error_to_report;
    try
    {
        CLI11_PARSE(app, argc, argv);
        if (app.get_subcommands().size() == 0)
        {
            std::cout << app.help();
        }
    }
    catch (const std::exception& e)
    {
        error_to_report = e.what();
    }

    if (error_to_report)
    {
        if (!logging::is_logging_started())
        {
            logging::start_logging(ctx.logging_params);
        }
        LOG_CRITICAL << error_to_report.value();
        logging::stop_logging();
        return 1;
    }

    logging::stop_logging();
    return 0;
}

// Copyright (c) 2025, optrust Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef OPTRUST_CLI_COMMON_OPTIONS_HPP
#define OPTRUST_CLI_COMMON_OPTIONS_HPP

#include <string>

#include <CLI/CLI.hpp>

#include "optrust/core/context.hpp"

/// Options shared by every subcommand.
struct CommonOptions
{
    int verbosity = 0;
    std::string registry_file = {};
};

void
init_common_options(CLI::App* com, CommonOptions& options);

/**
 * Apply the parsed common options to the context and start logging accordingly.
 *
 * Must be called at the beginning of every subcommand callback.
 */
void
apply_common_options(const CommonOptions& options, optrust::Context& ctx);

#endif

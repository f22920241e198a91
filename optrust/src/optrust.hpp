// Copyright (c) 2025, optrust Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef OPTRUST_CLI_OPTRUST_HPP
#define OPTRUST_CLI_OPTRUST_HPP

#include <CLI/CLI.hpp>

#include "optrust/core/context.hpp"

#include "common_options.hpp"

void
set_path_command(CLI::App* subcom, const CommonOptions& options, optrust::Context& ctx);

void
set_digest_command(CLI::App* subcom, const CommonOptions& options, optrust::Context& ctx);

void
set_verify_command(CLI::App* subcom, const CommonOptions& options, optrust::Context& ctx);

void
set_validate_command(CLI::App* subcom, const CommonOptions& options, optrust::Context& ctx);

void
set_bootstrap_command(CLI::App* subcom, const CommonOptions& options, optrust::Context& ctx);

void
set_optrust_command(CLI::App* com, CommonOptions& options, optrust::Context& ctx);

#endif

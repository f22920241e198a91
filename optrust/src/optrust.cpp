// Copyright (c) 2025, optrust Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <cstdlib>
#include <iostream>

#include "optrust.hpp"
#include "version.hpp"

using namespace optrust;  // NOLINT(build/namespaces)

void
set_optrust_command(CLI::App* com, CommonOptions& options, Context& ctx)
{
    init_common_options(com, options);

    auto print_version = [](int /*count*/)
    {
        std::cout << optrust_cli::version() << std::endl;
        exit(0);
    };

    com->add_flag_function("--version", print_version);

    CLI::App* path_subcom = com->add_subcommand("path", "Show the location of the versions registry");
    set_path_command(path_subcom, options, ctx);

    CLI::App* digest_subcom = com->add_subcommand(
        "digest",
        "Show the trusted SHA-256 digest of a 1Password CLI version"
    );
    set_digest_command(digest_subcom, options, ctx);

    CLI::App* verify_subcom = com->add_subcommand(
        "verify",
        "Verify a 1Password CLI binary against its trusted digest"
    );
    set_verify_command(verify_subcom, options, ctx);

    CLI::App* validate_subcom = com->add_subcommand("validate", "Validate a versions registry");
    set_validate_command(validate_subcom, options, ctx);

    CLI::App* bootstrap_subcom = com->add_subcommand(
        "bootstrap",
        "Install the bundled versions registry at the default location if missing"
    );
    set_bootstrap_command(bootstrap_subcom, options, ctx);

    com->require_subcommand(0, 1);
}

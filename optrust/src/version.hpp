// Copyright (c) 2025, optrust Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef OPTRUST_CLI_VERSION_HPP
#define OPTRUST_CLI_VERSION_HPP

#include <string>

#define OPTRUST_CLI_VERSION_MAJOR 0
#define OPTRUST_CLI_VERSION_MINOR 3
#define OPTRUST_CLI_VERSION_PATCH 0

#define OPTRUST_CLI_VERSION_STRING "0.3.0"
#define OPTRUST_CLI_VERSION                                                                        \
    (OPTRUST_CLI_VERSION_MAJOR * 10000 + OPTRUST_CLI_VERSION_MINOR * 100 + OPTRUST_CLI_VERSION_PATCH)

namespace optrust_cli
{
    std::string version();
}

#endif

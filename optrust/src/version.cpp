// Copyright (c) 2025, optrust Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include "version.hpp"

namespace optrust_cli
{
    std::string version()
    {
        return OPTRUST_CLI_VERSION_STRING;
    }
}

// Copyright (c) 2025, optrust Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include "optrust/core/context.hpp"
#include "optrust/specs/platform.hpp"
#include "optrust/util/environment.hpp"
#include "optrust/util/string.hpp"

namespace optrust
{
    Context::Context()
        : platform_params{ std::string(specs::host_os()), std::string(specs::host_arch()) }
    {
    }

    auto Context::from_environment() -> Context
    {
        auto ctx = Context();
        if (auto value = util::get_env(std::string(registry_path_env_var)))
        {
            if (const auto path = util::strip(*value); !path.empty())
            {
                ctx.registry_params.override_path = fs::path(path);
            }
        }
        return ctx;
    }
}

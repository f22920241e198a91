// Copyright (c) 2025, optrust Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef OPTRUST_CORE_CONTEXT_HPP
#define OPTRUST_CORE_CONTEXT_HPP

#include <string>
#include <string_view>

#include "optrust/core/logging.hpp"
#include "optrust/fs/filesystem.hpp"

namespace optrust
{
    /// Environment variable naming a registry file to use instead of the default location.
    inline constexpr std::string_view registry_path_env_var = "OP_SECRETS_ACTION_VERSIONS_FILE";

    struct RegistryParams
    {
        /// Registry file to use as-is, bootstrap is never attempted when set.
        fs::path override_path = {};

        /// Base configuration directory, the user config directory when empty.
        fs::path config_root = {};
    };

    struct PlatformParams
    {
        /// Operating system identifier, such as `linux`.
        std::string os = {};

        /// CPU architecture identifier, such as `amd64`.
        std::string arch = {};
    };

    /**
     * Runtime parameters of the library.
     *
     * Default constructed parameters describe the build host with no registry override.
     */
    class Context
    {
    public:

        /**
         * Create a context from the process environment.
         *
         * The registry override is read from `OP_SECRETS_ACTION_VERSIONS_FILE`, surrounding
         * whitespaces removed, and ignored when empty.
         */
        [[nodiscard]] static auto from_environment() -> Context;

        Context();

        LoggingParams logging_params = {};
        RegistryParams registry_params = {};
        PlatformParams platform_params = {};
    };
}
#endif

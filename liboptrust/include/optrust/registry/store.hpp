// Copyright (c) 2025, optrust Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef OPTRUST_REGISTRY_STORE_HPP
#define OPTRUST_REGISTRY_STORE_HPP

#include <string_view>

#include "optrust/core/context.hpp"
#include "optrust/core/error_handling.hpp"
#include "optrust/fs/filesystem.hpp"
#include "optrust/registry/registry.hpp"

namespace optrust::registry
{
    inline constexpr std::string_view default_registry_vendor_dir = "1password-secrets";
    inline constexpr std::string_view default_registry_app_dir = "action";
    inline constexpr std::string_view default_registry_filename = "1password-cli-versions.yaml";

    /**
     * The registry document compiled into the library.
     *
     * It covers a single known-good version with all platforms and is only used to seed
     * an absent registry at the default location.
     */
    [[nodiscard]] auto embedded_registry_content() -> std::string_view;

    struct RegistryLocation
    {
        fs::path path;
        /// Whether the path was explicitly provided rather than the default location.
        bool is_override = false;
    };

    /**
     * The default registry path under the configuration root.
     *
     * That is `<config root>/1password-secrets/action/1password-cli-versions.yaml`, where
     * the configuration root is `params.config_root` if set, or the user config directory.
     * Fails with a `configuration` error if the user config directory cannot be found.
     */
    [[nodiscard]] auto default_registry_path(const RegistryParams& params) -> expected_t<fs::path>;

    /**
     * Find where the registry lives.
     *
     * An override path is used as-is, without checking it exists, otherwise the default
     * path is returned.
     */
    [[nodiscard]] auto resolve_registry_path(const RegistryParams& params)
        -> expected_t<RegistryLocation>;

    /**
     * Install a registry document at the given path if no file exists there.
     *
     * The document is parsed and validated before anything is written.
     * Missing parent directories are created accessible by the owner only and the file is
     * written readable and writable by the owner only.
     * Concurrent calls are safe: the file appears atomically and is never overwritten.
     *
     * @return `true` if the file was written, `false` if it already existed.
     */
    [[nodiscard]] auto bootstrap_registry_if_missing(const fs::path& registry_path, std::string_view content)
        -> expected_t<bool>;

    /**
     * Same as above with the embedded registry document.
     */
    [[nodiscard]] auto bootstrap_registry_if_missing(const fs::path& registry_path)
        -> expected_t<bool>;

    /**
     * Load the registry from its resolved location.
     *
     * With an override path, the file is loaded directly and bootstrap is skipped.
     * Otherwise, the embedded registry is installed first if the default file is missing.
     */
    [[nodiscard]] auto load_or_bootstrap_registry(const RegistryParams& params)
        -> expected_t<Registry>;
}
#endif

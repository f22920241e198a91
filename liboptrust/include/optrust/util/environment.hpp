// Copyright (c) 2025, optrust Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef OPTRUST_UTIL_ENVIRONMENT_HPP
#define OPTRUST_UTIL_ENVIRONMENT_HPP

#include <optional>
#include <string>
#include <unordered_map>

namespace optrust::util
{
    /**
     * Get an environment variable.
     */
    [[nodiscard]] auto get_env(const std::string& key) -> std::optional<std::string>;

    /**
     * Set an environment variable.
     */
    void set_env(const std::string& key, const std::string& value);

    /**
     * Unset an environment variable.
     */
    void unset_env(const std::string& key);

    using environment_map = std::unordered_map<std::string, std::string>;

    /**
     * Return a map of all environment variables.
     */
    [[nodiscard]] auto get_env_map() -> environment_map;

    /**
     * Set the environment to be exactly the map given.
     *
     * This unsets all environment variables not referred to in the map.
     */
    void set_env_map(const environment_map& env);

    /*
     * Return the current user home directory.
     *
     * Throws a `std::runtime_error` if it cannot be determined.
     */
    [[nodiscard]] auto user_home_dir() -> std::string;

    /**
     * Return the current user config directory.
     *
     * On Windows, the roaming application data directory `%APPDATA%`, falling back to
     * `<home>/AppData/Roaming`.
     * Elsewhere, `XDG_CONFIG_HOME`, falling back to the XDG default `<home>/.config`.
     */
    [[nodiscard]] auto user_config_dir() -> std::string;
}
#endif

// Copyright (c) 2025, optrust Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <cstdlib>
#include <filesystem>
#include <mutex>
#include <stdexcept>
#include <string_view>

#include <fmt/format.h>

#ifdef _WIN32
#include <stdlib.h>
#else
#include <pwd.h>
#include <unistd.h>

extern "C"
{
    extern char** environ;  // Unix defined
}
#endif

#include "optrust/util/environment.hpp"

namespace optrust::util
{
    namespace
    {
        // Calls to getenv kinds of functions are not thread-safe.
        std::mutex env_mutex = {};

        auto non_empty_env(const std::string& key) -> std::optional<std::string>
        {
            if (auto val = get_env(key); val && !val->empty())
            {
                return val;
            }
            return {};
        }
    }

#ifdef _WIN32

    auto get_env(const std::string& key) -> std::optional<std::string>
    {
        std::scoped_lock lock{ env_mutex };
        char* buffer = nullptr;
        std::size_t size = 0;
        if (::_dupenv_s(&buffer, &size, key.c_str()) != 0 || buffer == nullptr)
        {
            return {};
        }
        auto out = std::string(buffer);
        std::free(buffer);
        return out;
    }

    void set_env(const std::string& key, const std::string& value)
    {
        std::scoped_lock lock{ env_mutex };
        if (::_putenv_s(key.c_str(), value.c_str()) != 0)
        {
            throw std::runtime_error(
                fmt::format(R"(Could not set environment variable "{}" to "{}")", key, value)
            );
        }
    }

    void unset_env(const std::string& key)
    {
        std::scoped_lock lock{ env_mutex };
        if (::_putenv_s(key.c_str(), "") != 0)
        {
            throw std::runtime_error(fmt::format(R"(Could not unset environment variable "{}")", key));
        }
    }

    auto get_env_map() -> environment_map
    {
        std::scoped_lock lock{ env_mutex };
        auto env = environment_map();
        for (char** var = ::_environ; var && *var; ++var)
        {
            const auto expr = std::string_view(*var);
            const auto pos = expr.find('=');
            if (pos == 0)
            {
                // Hidden per-drive variables such as "=C:=C:\\"
                continue;
            }
            env.emplace(expr.substr(0, pos), (pos != expr.npos) ? std::string(expr.substr(pos + 1)) : "");
        }
        return env;
    }

    auto user_home_dir() -> std::string
    {
        if (auto maybe_home = non_empty_env("USERPROFILE"))
        {
            return *maybe_home;
        }
        const auto drive = get_env("HOMEDRIVE").value_or("");
        const auto path = get_env("HOMEPATH").value_or("");
        if (!drive.empty() && !path.empty())
        {
            return drive + path;
        }
        throw std::runtime_error("Cannot determine HOME (checked USERPROFILE, HOMEDRIVE and HOMEPATH env vars)");
    }

    auto user_config_dir() -> std::string
    {
        if (auto maybe_dir = non_empty_env("APPDATA"))
        {
            return *maybe_dir;
        }
        return (std::filesystem::path(user_home_dir()) / "AppData" / "Roaming").string();
    }

#else  // #ifdef _WIN32

    auto get_env(const std::string& key) -> std::optional<std::string>
    {
        std::scoped_lock lock{ env_mutex };
        if (const char* val = std::getenv(key.c_str()))
        {
            return val;
        }
        return {};
    }

    void set_env(const std::string& key, const std::string& value)
    {
        std::scoped_lock lock{ env_mutex };
        const auto result = ::setenv(key.c_str(), value.c_str(), 1);
        if (result != 0)
        {
            throw std::runtime_error(
                fmt::format(R"(Could not set environment variable "{}" to "{}")", key, value)
            );
        }
    }

    void unset_env(const std::string& key)
    {
        std::scoped_lock lock{ env_mutex };
        const auto res = ::unsetenv(key.c_str());
        if (res != 0)
        {
            throw std::runtime_error(fmt::format(R"(Could not unset environment variable "{}")", key));
        }
    }

    auto get_env_map() -> environment_map
    {
        std::scoped_lock lock{ env_mutex };
        auto env = environment_map();
        for (std::size_t i = 0; environ[i]; ++i)
        {
            const auto expr = std::string_view(environ[i]);
            const auto pos = expr.find('=');
            env.emplace(expr.substr(0, pos), (pos != expr.npos) ? std::string(expr.substr(pos + 1)) : "");
        }
        return env;
    }

    auto user_home_dir() -> std::string
    {
        if (auto maybe_home = non_empty_env("HOME"))
        {
            return *maybe_home;
        }
        if (const auto* user = ::getpwuid(::getuid()))
        {
            if (const char* maybe_home = user->pw_dir)
            {
                return maybe_home;
            }
        }
        throw std::runtime_error("HOME not set.");
    }

    auto user_config_dir() -> std::string
    {
        if (auto maybe_dir = non_empty_env("XDG_CONFIG_HOME"))
        {
            return *maybe_dir;
        }
        return (std::filesystem::path(user_home_dir()) / ".config").string();
    }

#endif  // #ifdef _WIN32

    void set_env_map(const environment_map& env)
    {
        for (const auto& [key, val] : get_env_map())
        {
            if (env.find(key) == env.cend())
            {
                unset_env(key);
            }
        }
        for (const auto& [key, val] : env)
        {
            set_env(key, val);
        }
    }
}

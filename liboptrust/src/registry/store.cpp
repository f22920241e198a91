// Copyright (c) 2025, optrust Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <any>
#include <stdexcept>
#include <system_error>

#include <fmt/format.h>

#include "optrust/core/logging.hpp"
#include "optrust/registry/loader.hpp"
#include "optrust/registry/store.hpp"
#include "optrust/registry/validation.hpp"
#include "optrust/util/environment.hpp"

namespace optrust::registry
{
    namespace
    {
        // Here we are embedding the default registry document
        constexpr const char embedded_registry_yaml[] =
#include "../../data/default_registry.yaml.hpp"
            ;
    }

    auto embedded_registry_content() -> std::string_view
    {
        return embedded_registry_yaml;
    }

    auto default_registry_path(const RegistryParams& params) -> expected_t<fs::path>
    {
        auto config_root = params.config_root;
        if (config_root.empty())
        {
            try
            {
                config_root = fs::path(util::user_config_dir());
            }
            catch (const std::runtime_error& err)
            {
                return make_unexpected(
                    fmt::format(
                        "unable to determine the configuration directory (APPDATA, XDG_CONFIG_HOME or home): {}",
                        err.what()
                    ),
                    optrust_error_code::configuration
                );
            }
        }
        return config_root / default_registry_vendor_dir / default_registry_app_dir
               / default_registry_filename;
    }

    auto resolve_registry_path(const RegistryParams& params) -> expected_t<RegistryLocation>
    {
        if (!params.override_path.empty())
        {
            if (!params.override_path.is_absolute())
            {
                LOG_WARNING << "Versions registry path '" << params.override_path.string()
                            << "' is not absolute, it is resolved against the working directory";
            }
            LOG_DEBUG << "Using versions registry override '" << params.override_path.string() << "'";
            return RegistryLocation{ params.override_path, true };
        }

        auto path = default_registry_path(params);
        if (!path)
        {
            return forward_error(path);
        }
        LOG_DEBUG << "Using default versions registry location '" << path->string() << "'";
        return RegistryLocation{ std::move(path).value(), false };
    }

    auto bootstrap_registry_if_missing(const fs::path& registry_path, std::string_view content)
        -> expected_t<bool>
    {
        std::error_code ec;
        if (fs::exists(registry_path, ec))
        {
            return false;
        }
        if (ec)
        {
            return make_unexpected(
                fmt::format("failed to check versions registry at '{}': {}", registry_path.string(), ec.message()),
                optrust_error_code::registry_write
            );
        }

        // The document must never be installed unless it would load successfully.
        auto registry = parse_registry(content);
        if (!registry)
        {
            return make_unexpected(
                fmt::format("bundled versions registry is invalid YAML: {}", registry.error().what()),
                optrust_error_code::registry_parse
            );
        }
        if (auto valid = validate_registry(*registry); !valid)
        {
            auto details = RegistryValidationError::get_details(valid.error());
            return make_unexpected(
                fmt::format("bundled versions registry failed validation: {}", valid.error().what()),
                optrust_error_code::registry_validation,
                std::move(details)
            );
        }

        const auto dir = registry_path.parent_path();
        path::create_private_directories(dir, ec);
        if (ec)
        {
            return make_unexpected(
                fmt::format("failed to create config directory '{}': {}", dir.string(), ec.message()),
                optrust_error_code::registry_write
            );
        }

        const bool written = path::write_private_file_if_absent(registry_path, content, ec);
        if (ec)
        {
            return make_unexpected(
                fmt::format("failed to write versions registry to '{}': {}", registry_path.string(), ec.message()),
                optrust_error_code::registry_write
            );
        }
        if (written)
        {
            LOG_INFO << "Installed bundled versions registry at '" << registry_path.string() << "'";
        }
        return written;
    }

    auto bootstrap_registry_if_missing(const fs::path& registry_path) -> expected_t<bool>
    {
        return bootstrap_registry_if_missing(registry_path, embedded_registry_content());
    }

    auto load_or_bootstrap_registry(const RegistryParams& params) -> expected_t<Registry>
    {
        auto location = resolve_registry_path(params);
        if (!location)
        {
            return forward_error(location);
        }

        if (!location->is_override)
        {
            if (auto bootstrapped = bootstrap_registry_if_missing(location->path); !bootstrapped)
            {
                return make_unexpected(
                    fmt::format("failed to install bundled versions registry: {}", bootstrapped.error().what()),
                    bootstrapped.error().error_code(),
                    std::any(bootstrapped.error().data())
                );
            }
        }
        return read_registry(location->path);
    }
}

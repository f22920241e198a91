// Copyright (c) 2025, optrust Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <set>
#include <string>
#include <system_error>

#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

#include "optrust/core/logging.hpp"
#include "optrust/registry/loader.hpp"
#include "optrust/registry/validation.hpp"

namespace optrust::registry
{
    namespace
    {
        // yaml-cpp keeps every pair of a mapping, repeated keys included.
        void check_unique_keys(const YAML::Node& node, std::string_view where)
        {
            auto seen = std::set<std::string>();
            for (const auto& pair : node)
            {
                if (!pair.first.IsScalar())
                {
                    continue;
                }
                if (!seen.insert(pair.first.Scalar()).second)
                {
                    throw YAML::RepresentationException(
                        pair.first.Mark(),
                        fmt::format("duplicate key '{}' in {}", pair.first.Scalar(), where)
                    );
                }
            }
        }

        auto read_checksum(const YAML::Node& node) -> std::string
        {
            if (!node || node.IsNull())
            {
                return {};
            }
            if (!node.IsScalar())
            {
                throw YAML::RepresentationException(node.Mark(), "checksum must be a string");
            }
            return node.as<std::string>();
        }

        auto read_platform_checksums(const YAML::Node& node) -> PlatformChecksums
        {
            auto checksums = PlatformChecksums();
            if (node.IsNull())
            {
                return checksums;
            }
            if (!node.IsMap())
            {
                throw YAML::RepresentationException(
                    node.Mark(),
                    "version entry must be a mapping of platform checksums"
                );
            }
            check_unique_keys(node, "version entry");
            for (const auto key : specs::known_platform_keys())
            {
                checksums.get(key) = read_checksum(node[std::string(specs::platform_key_name(key))]);
            }
            return checksums;
        }

        auto read_registry_node(const YAML::Node& root) -> Registry
        {
            auto registry = Registry();
            if (!root || root.IsNull())
            {
                return registry;
            }
            if (!root.IsMap())
            {
                throw YAML::RepresentationException(root.Mark(), "registry document must be a mapping");
            }
            check_unique_keys(root, "registry document");

            if (const auto& schema_node = root["schema_version"]; schema_node && !schema_node.IsNull())
            {
                registry.schema_version = schema_node.as<int>();
            }
            if (const auto& generated_node = root["generated_at"];
                generated_node && !generated_node.IsNull())
            {
                registry.generated_at = generated_node.as<std::string>();
            }
            if (const auto& versions_node = root["versions"]; versions_node && !versions_node.IsNull())
            {
                if (!versions_node.IsMap())
                {
                    throw YAML::RepresentationException(
                        versions_node.Mark(),
                        "versions must be a mapping"
                    );
                }
                check_unique_keys(versions_node, "versions");
                for (const auto& entry : versions_node)
                {
                    registry.versions.emplace(
                        entry.first.as<std::string>(),
                        read_platform_checksums(entry.second)
                    );
                }
            }
            return registry;
        }
    }

    auto parse_registry(std::string_view yaml_content) -> expected_t<Registry>
    {
        try
        {
            return read_registry_node(YAML::Load(std::string(yaml_content)));
        }
        catch (const YAML::Exception& err)
        {
            return make_unexpected(
                fmt::format("invalid YAML: {}", err.what()),
                optrust_error_code::registry_parse
            );
        }
    }

    auto read_registry(const fs::path& registry_path) -> expected_t<Registry>
    {
        LOG_DEBUG << "Loading versions registry from '" << registry_path.string() << "'";

        auto content = std::string();
        try
        {
            content = path::read_contents(registry_path);
        }
        catch (const std::system_error& err)
        {
            return make_unexpected(
                fmt::format(
                    "failed to read versions registry at '{}': {}",
                    registry_path.string(),
                    err.what()
                ),
                optrust_error_code::registry_read
            );
        }

        auto registry = parse_registry(content);
        if (!registry)
        {
            return make_unexpected(
                fmt::format(
                    "failed to parse YAML versions registry at '{}': {}",
                    registry_path.string(),
                    registry.error().what()
                ),
                optrust_error_code::registry_parse
            );
        }

        if (auto valid = validate_registry(*registry); !valid)
        {
            auto details = RegistryValidationError::get_details(valid.error());
            return make_unexpected(
                fmt::format(
                    "invalid versions registry at '{}': {}",
                    registry_path.string(),
                    valid.error().what()
                ),
                optrust_error_code::registry_validation,
                std::move(details)
            );
        }

        normalize_version_keys(*registry);
        LOG_DEBUG << "Loaded " << registry->versions.size() << " version(s) from versions registry";
        return registry;
    }
}

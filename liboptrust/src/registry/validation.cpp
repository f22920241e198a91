// Copyright (c) 2025, optrust Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>
#include <any>
#include <unordered_map>

#include <fmt/format.h>

#include "optrust/registry/validation.hpp"
#include "optrust/util/string.hpp"

namespace optrust::registry
{
    auto RegistryValidationError::get_details(const optrust_error& error)
        -> const RegistryValidationError&
    {
        return std::any_cast<const RegistryValidationError&>(error.data());
    }

    auto is_semver_like(std::string_view version) -> bool
    {
        std::size_t groups = 0;
        while (true)
        {
            const auto dot = version.find('.');
            const auto number = version.substr(0, dot);
            if (number.empty() || !std::all_of(number.cbegin(), number.cend(), util::is_digit))
            {
                return false;
            }
            ++groups;
            if (dot == std::string_view::npos)
            {
                break;
            }
            version.remove_prefix(dot + 1);
        }
        return groups == 3;
    }

    auto is_sha256_hex(std::string_view digest) -> bool
    {
        return (digest.size() == 64) && std::all_of(digest.cbegin(), digest.cend(), util::is_lower_hex);
    }

    namespace
    {
        void check_entry(
            const std::string& version,
            const PlatformChecksums& checksums,
            std::vector<Violation>& violations
        )
        {
            if (!is_semver_like(normalize_version(version)))
            {
                violations.push_back({
                    .kind = violation_kind::invalid_version_key,
                    .version = version,
                    .message = fmt::format(
                        "invalid version key '{}' (expected semantic version like 2.31.1)",
                        version
                    ),
                });
            }

            bool at_least_one = false;
            for (const auto key : specs::known_platform_keys())
            {
                const auto& value = checksums.get(key);
                if (util::strip(value).empty())
                {
                    continue;
                }
                at_least_one = true;
                if (!is_sha256_hex(value))
                {
                    violations.push_back({
                        .kind = violation_kind::invalid_checksum,
                        .version = version,
                        .platform = key,
                        .message = fmt::format(
                            "version {}: invalid {} checksum (must be 64 hex chars)",
                            version,
                            specs::platform_key_name(key)
                        ),
                    });
                }
            }
            if (!at_least_one)
            {
                violations.push_back({
                    .kind = violation_kind::missing_checksums,
                    .version = version,
                    .message = fmt::format("version {}: no platform checksums provided", version),
                });
            }
        }
    }

    auto collect_violations(const Registry& registry) -> std::vector<Violation>
    {
        auto violations = std::vector<Violation>();

        if (registry.schema_version != supported_schema_version)
        {
            violations.push_back({
                .kind = violation_kind::unexpected_schema_version,
                .message = fmt::format(
                    "unexpected schema_version={} (expected {})",
                    registry.schema_version,
                    supported_schema_version
                ),
            });
        }

        if (registry.versions.empty())
        {
            violations.push_back({
                .kind = violation_kind::empty_versions,
                .message = "versions map is empty",
            });
            return violations;
        }

        auto seen = std::unordered_map<std::string, std::string>();
        for (const auto& [version, checksums] : registry.versions)
        {
            auto [it, inserted] = seen.emplace(normalize_version(version), version);
            if (!inserted)
            {
                violations.push_back({
                    .kind = violation_kind::duplicate_version_key,
                    .version = version,
                    .message = fmt::format(
                        "duplicate version key '{}' (normalizes to {} like '{}')",
                        version,
                        it->first,
                        it->second
                    ),
                });
            }
            check_entry(version, checksums, violations);
        }
        return violations;
    }

    auto validation_failure_message(const std::vector<Violation>& violations) -> std::string
    {
        if (violations.empty())
        {
            return "schema validation failed";
        }
        auto messages = std::vector<std::string_view>();
        messages.reserve(violations.size());
        for (const auto& v : violations)
        {
            messages.push_back(v.message);
        }
        return fmt::format("schema validation failed: {}", util::join("; ", messages));
    }

    auto validate_registry(const Registry& registry) -> expected_t<void>
    {
        auto violations = collect_violations(registry);
        if (violations.empty())
        {
            return {};
        }
        auto message = validation_failure_message(violations);
        return make_unexpected(
            message,
            optrust_error_code::registry_validation,
            RegistryValidationError{ std::move(violations) }
        );
    }
}

// Copyright (c) 2025, optrust Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <stdexcept>
#include <utility>

#include "optrust/core/logging.hpp"
#include "optrust/registry/registry.hpp"
#include "optrust/registry/validation.hpp"
#include "optrust/util/string.hpp"

namespace optrust::registry
{
    auto PlatformChecksums::get(specs::PlatformKey key) const -> const std::string&
    {
        switch (key)
        {
            case specs::PlatformKey::linux_amd64:
                return linux_amd64;
            case specs::PlatformKey::linux_arm64:
                return linux_arm64;
            case specs::PlatformKey::darwin_amd64:
                return darwin_amd64;
            case specs::PlatformKey::darwin_arm64:
                return darwin_arm64;
            case specs::PlatformKey::windows_amd64:
                return windows_amd64;
            default:
                throw std::invalid_argument("Invalid platform key");
        }
    }

    auto PlatformChecksums::get(specs::PlatformKey key) -> std::string&
    {
        return const_cast<std::string&>(std::as_const(*this).get(key));
    }

    auto PlatformChecksums::has_any() const -> bool
    {
        for (const auto key : specs::known_platform_keys())
        {
            if (!util::strip(get(key)).empty())
            {
                return true;
            }
        }
        return false;
    }

    auto normalize_version(std::string_view version) -> std::string
    {
        return std::string(util::remove_prefix(util::strip(version), 'v'));
    }

    void normalize_version_keys(Registry& registry)
    {
        auto normalized = std::map<std::string, PlatformChecksums>();
        for (auto& [version, checksums] : registry.versions)
        {
            normalized.insert_or_assign(normalize_version(version), std::move(checksums));
        }
        registry.versions = std::move(normalized);
    }

    auto get_expected_digest(const Registry& registry, std::string_view version, specs::PlatformKey key)
        -> std::optional<std::string>
    {
        const auto iter = registry.versions.find(normalize_version(version));
        if (iter == registry.versions.cend())
        {
            return std::nullopt;
        }
        const auto& digest = iter->second.get(key);
        if (util::strip(digest).empty())
        {
            return std::nullopt;
        }
        return digest;
    }

    auto get_expected_digest(
        const Registry& registry,
        std::string_view version,
        std::string_view platform_key
    ) -> std::optional<std::string>
    {
        if (const auto key = specs::platform_key_parse(platform_key))
        {
            return get_expected_digest(registry, version, *key);
        }
        return std::nullopt;
    }

    auto extend_registry(Registry& registry, std::string_view version, PlatformChecksums checksums)
        -> expected_t<void>
    {
        auto normalized = normalize_version(version);
        auto scratch = Registry{
            .schema_version = registry.schema_version,
            .versions = { { normalized, checksums } },
        };
        if (auto valid = validate_registry(scratch); !valid)
        {
            return forward_error(valid);
        }

        LOG_DEBUG << "Registry extended with version " << normalized;
        registry.versions.insert_or_assign(std::move(normalized), std::move(checksums));
        return {};
    }
}

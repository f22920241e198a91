// Copyright (c) 2025, optrust Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef OPTRUST_REGISTRY_REGISTRY_HPP
#define OPTRUST_REGISTRY_REGISTRY_HPP

#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "optrust/core/error_handling.hpp"
#include "optrust/specs/platform.hpp"

namespace optrust::registry
{
    /// The only revision of the registry document this library understands.
    inline constexpr int supported_schema_version = 1;

    /**
     * SHA-256 checksums of one tool version, one field per platform key.
     *
     * An empty (or whitespace only) field means no checksum is known for that platform.
     */
    struct PlatformChecksums
    {
        std::string linux_amd64 = {};
        std::string linux_arm64 = {};
        std::string darwin_amd64 = {};
        std::string darwin_arm64 = {};
        std::string windows_amd64 = {};

        [[nodiscard]] auto get(specs::PlatformKey key) const -> const std::string&;
        [[nodiscard]] auto get(specs::PlatformKey key) -> std::string&;

        /// @returns `true` if at least one field holds a non-blank value.
        [[nodiscard]] auto has_any() const -> bool;

        auto operator==(const PlatformChecksums& other) const -> bool = default;
    };

    /**
     * The trusted checksum table, mapping tool versions to per-platform digests.
     *
     * A registry returned by the loader is validated and its version keys are normalized.
     */
    struct Registry
    {
        int schema_version = 0;
        std::string generated_at = {};
        std::map<std::string, PlatformChecksums> versions = {};

        auto operator==(const Registry& other) const -> bool = default;
    };

    /**
     * Strip surrounding whitespaces and a single leading `v`, e.g. `v2.31.1` -> `2.31.1`.
     */
    [[nodiscard]] auto normalize_version(std::string_view version) -> std::string;

    /**
     * Rekey the version map with normalized versions.
     *
     * When two keys normalize to the same version, the last one in key order wins, which
     * validation reports beforehand as a duplicate.
     */
    void normalize_version_keys(Registry& registry);

    /**
     * Return the expected digest for a version and platform.
     *
     * The version is normalized before lookup.
     * An absent version or an empty checksum field both return an empty optional.
     */
    [[nodiscard]] auto
    get_expected_digest(const Registry& registry, std::string_view version, specs::PlatformKey key)
        -> std::optional<std::string>;

    /**
     * Same as above with the platform key given by its registry field name.
     *
     * An unknown platform key name returns an empty optional.
     */
    [[nodiscard]] auto get_expected_digest(
        const Registry& registry,
        std::string_view version,
        std::string_view platform_key
    ) -> std::optional<std::string>;

    /**
     * Add or replace the checksums of a version in a loaded registry.
     *
     * The new entry is validated on its own, with the same rules as a whole document and
     * the schema version of @p registry, before being merged under its normalized version.
     * On failure, the registry is left unchanged and the error carries a
     * `RegistryValidationError`.
     * Changes are not persisted to disk.
     */
    [[nodiscard]] auto
    extend_registry(Registry& registry, std::string_view version, PlatformChecksums checksums)
        -> expected_t<void>;
}
#endif

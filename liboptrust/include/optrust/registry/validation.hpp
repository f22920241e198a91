// Copyright (c) 2025, optrust Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef OPTRUST_REGISTRY_VALIDATION_HPP
#define OPTRUST_REGISTRY_VALIDATION_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "optrust/core/error_handling.hpp"
#include "optrust/registry/registry.hpp"
#include "optrust/specs/platform.hpp"

namespace optrust::registry
{
    enum class violation_kind
    {
        unexpected_schema_version,  ///< The document revision is not the supported one.
        empty_versions,             ///< The document lists no version at all.
        invalid_version_key,        ///< A version key is not like `2.31.1` once normalized.
        duplicate_version_key,      ///< Two version keys normalize to the same version.
        invalid_checksum,           ///< A checksum is not 64 lowercase hexadecimal characters.
        missing_checksums           ///< A version has no checksum for any platform.
    };

    /**
     * A single broken invariant of a registry document.
     */
    struct Violation
    {
        violation_kind kind;
        /// The version key as written in the document, empty for document-wide violations.
        std::string version = {};
        std::optional<specs::PlatformKey> platform = std::nullopt;
        std::string message = {};

        auto operator==(const Violation& other) const -> bool = default;
    };

    /**
     * Details attached to an `optrust_error` with code `registry_validation`.
     */
    struct RegistryValidationError
    {
        std::vector<Violation> violations;

        static auto get_details(const optrust_error& error) -> const RegistryValidationError&;
    };

    /**
     * Return true if the string is like `2.31.1`, that is three dot separated numbers.
     */
    [[nodiscard]] auto is_semver_like(std::string_view version) -> bool;

    /**
     * Return true if the string is a SHA-256 digest in lowercase hexadecimal encoding.
     */
    [[nodiscard]] auto is_sha256_hex(std::string_view digest) -> bool;

    /**
     * Check every invariant of the registry and return all the violations found.
     *
     * Versions are visited in key order so the result is deterministic.
     */
    [[nodiscard]] auto collect_violations(const Registry& registry) -> std::vector<Violation>;

    /**
     * Format the message of an aggregated validation failure.
     */
    [[nodiscard]] auto validation_failure_message(const std::vector<Violation>& violations)
        -> std::string;

    /**
     * Validate a registry, reporting every violation at once.
     *
     * The error has code `registry_validation` and carries a `RegistryValidationError`.
     */
    [[nodiscard]] auto validate_registry(const Registry& registry) -> expected_t<void>;
}
#endif

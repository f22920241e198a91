// Copyright (c) 2025, optrust Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef OPTRUST_REGISTRY_LOADER_HPP
#define OPTRUST_REGISTRY_LOADER_HPP

#include <string_view>

#include "optrust/core/error_handling.hpp"
#include "optrust/fs/filesystem.hpp"
#include "optrust/registry/registry.hpp"

namespace optrust::registry
{
    /**
     * Parse a registry YAML document without validating it.
     *
     * Unknown keys are ignored at every level and `null` values count as empty.
     * Malformed YAML, nodes of the wrong kind, or a key repeated in a mapping fail with a
     * `registry_parse` error.
     */
    [[nodiscard]] auto parse_registry(std::string_view yaml_content) -> expected_t<Registry>;

    /**
     * Read, parse and validate the registry stored at the given path.
     *
     * On success the version keys of the returned registry are normalized.
     * Failures are reported with the codes `registry_read`, `registry_parse` or
     * `registry_validation`, with a message naming the path.
     */
    [[nodiscard]] auto read_registry(const fs::path& registry_path) -> expected_t<Registry>;
}
#endif

// Copyright (c) 2025, optrust Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef OPTRUST_SPECS_PLATFORM_HPP
#define OPTRUST_SPECS_PLATFORM_HPP

#include <array>
#include <optional>
#include <string>
#include <string_view>

#include "optrust/core/error_handling.hpp"

namespace optrust::specs
{
    /**
     * All platforms for which the registry can hold a checksum.
     *
     * The keys are the field names used in the registry document.
     */
    enum class PlatformKey
    {
        linux_amd64 = 0,
        linux_arm64,
        darwin_amd64,
        darwin_arm64,
        windows_amd64,

        // For reflexion purposes only
        count_,
    };

    [[nodiscard]] constexpr auto known_platform_keys_count() -> std::size_t
    {
        return static_cast<std::size_t>(PlatformKey::count_);
    }

    [[nodiscard]] constexpr auto known_platform_keys()
        -> std::array<PlatformKey, known_platform_keys_count()>;

    [[nodiscard]] constexpr auto known_platform_key_names()
        -> std::array<std::string_view, known_platform_keys_count()>;

    /**
     * Convert the enumeration to its registry field name.
     */
    [[nodiscard]] constexpr auto platform_key_name(PlatformKey key) -> std::string_view;

    /**
     * Return the enum matching the registry field name.
     *
     * Matching is exact: no case folding and no whitespace stripping.
     */
    [[nodiscard]] auto platform_key_parse(std::string_view str) -> std::optional<PlatformKey>;

    /**
     * Details attached to an `optrust_error` with code `unsupported_platform`.
     */
    struct UnsupportedPlatformError
    {
        std::string os;
        std::string arch;

        static auto get_details(const optrust_error& error) -> const UnsupportedPlatformError&;
    };

    /**
     * Map an operating system and CPU architecture identifier pair to a platform key.
     *
     * Identifiers are the lowercase `os` names `linux`, `darwin`, `windows` and
     * the architecture names `amd64`, `arm64`.
     * Only `{linux, darwin} x {amd64, arm64}` and `windows/amd64` are supported, every
     * other combination fails with an `unsupported_platform` error carrying the raw
     * identifiers.
     */
    [[nodiscard]] auto resolve_platform_key(std::string_view os, std::string_view arch)
        -> expected_t<PlatformKey>;

    /**
     * Operating system identifier of the platform optrust was built for.
     *
     * One of `linux`, `darwin`, `windows`, `freebsd`, `openbsd`, `netbsd` or `unknown`.
     */
    [[nodiscard]] auto host_os() -> std::string_view;

    /**
     * CPU architecture identifier of the platform optrust was built for.
     *
     * One of `amd64`, `arm64`, `386`, `arm`, `ppc64le`, `ppc64`, `s390x`, `riscv64` or
     * `unknown`.
     */
    [[nodiscard]] auto host_arch() -> std::string_view;

    /********************
     *  Implementation  *
     ********************/

    constexpr auto platform_key_name(PlatformKey key) -> std::string_view
    {
        switch (key)
        {
            case PlatformKey::linux_amd64:
                return "linux_amd64";
            case PlatformKey::linux_arm64:
                return "linux_arm64";
            case PlatformKey::darwin_amd64:
                return "darwin_amd64";
            case PlatformKey::darwin_arm64:
                return "darwin_arm64";
            case PlatformKey::windows_amd64:
                return "windows_amd64";
            default:
                return "";
        }
    }

    constexpr auto known_platform_keys() -> std::array<PlatformKey, known_platform_keys_count()>
    {
        auto out = std::array<PlatformKey, known_platform_keys_count()>{};
        for (std::size_t idx = 0; idx < out.size(); ++idx)
        {
            out[idx] = static_cast<PlatformKey>(idx);
        }
        return out;
    }

    constexpr auto known_platform_key_names()
        -> std::array<std::string_view, known_platform_keys_count()>
    {
        auto out = std::array<std::string_view, known_platform_keys_count()>{};
        auto iter = out.begin();
        for (auto key : known_platform_keys())
        {
            *(iter++) = platform_key_name(key);
        }
        return out;
    }
}
#endif

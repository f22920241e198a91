// Copyright (c) 2025, optrust Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <any>

#include <fmt/format.h>

#include "optrust/specs/platform.hpp"

namespace optrust::specs
{
    auto platform_key_parse(std::string_view str) -> std::optional<PlatformKey>
    {
        for (const auto key : known_platform_keys())
        {
            if (str == platform_key_name(key))
            {
                return { key };
            }
        }
        return {};
    }

    auto UnsupportedPlatformError::get_details(const optrust_error& error)
        -> const UnsupportedPlatformError&
    {
        return std::any_cast<const UnsupportedPlatformError&>(error.data());
    }

    namespace
    {
        constexpr std::string_view os_linux = "linux";
        constexpr std::string_view os_darwin = "darwin";
        constexpr std::string_view os_windows = "windows";
        constexpr std::string_view arch_amd64 = "amd64";
        constexpr std::string_view arch_arm64 = "arm64";

        auto lookup_platform_key(std::string_view os, std::string_view arch)
            -> std::optional<PlatformKey>
        {
            if (os == os_linux)
            {
                if (arch == arch_amd64)
                {
                    return PlatformKey::linux_amd64;
                }
                if (arch == arch_arm64)
                {
                    return PlatformKey::linux_arm64;
                }
            }
            else if (os == os_darwin)
            {
                if (arch == arch_amd64)
                {
                    return PlatformKey::darwin_amd64;
                }
                if (arch == arch_arm64)
                {
                    return PlatformKey::darwin_arm64;
                }
            }
            else if (os == os_windows)
            {
                if (arch == arch_amd64)
                {
                    return PlatformKey::windows_amd64;
                }
            }
            return std::nullopt;
        }
    }

    auto resolve_platform_key(std::string_view os, std::string_view arch) -> expected_t<PlatformKey>
    {
        if (auto key = lookup_platform_key(os, arch))
        {
            return *key;
        }
        return make_unexpected(
            fmt::format("unsupported platform: {}_{}", os, arch),
            optrust_error_code::unsupported_platform,
            UnsupportedPlatformError{ std::string(os), std::string(arch) }
        );
    }

    auto host_os() -> std::string_view
    {
#if defined(__linux__)
        return os_linux;
#elif defined(__APPLE__) && defined(__MACH__)
        return os_darwin;
#elif defined(_WIN32)
        return os_windows;
#elif defined(__FreeBSD__)
        return "freebsd";
#elif defined(__OpenBSD__)
        return "openbsd";
#elif defined(__NetBSD__)
        return "netbsd";
#else
        return "unknown";
#endif
    }

    auto host_arch() -> std::string_view
    {
#if defined(__x86_64__) || defined(_M_AMD64)
        return arch_amd64;
#elif defined(__aarch64__) || defined(__arm64__) || defined(_M_ARM64)
        return arch_arm64;
#elif defined(__i386__) || defined(_M_IX86)
        return "386";
#elif defined(__arm__) || defined(_M_ARM)
        return "arm";
#elif defined(__powerpc64__) || defined(__ppc64__)
#if (__BYTE_ORDER__ == __ORDER_BIG_ENDIAN__)
        return "ppc64";
#else
        return "ppc64le";
#endif
#elif defined(__s390x__)
        return "s390x";
#elif defined(__riscv) && defined(__riscv_xlen) && (__riscv_xlen == 64)
        return "riscv64";
#else
        return "unknown";
#endif
    }
}

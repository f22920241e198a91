// Copyright (c) 2025, optrust Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <array>
#include <string_view>
#include <utility>

#include <catch2/catch_all.hpp>

#include "optrust/specs/platform.hpp"

using namespace optrust;
using namespace optrust::specs;

namespace
{
    TEST_CASE("platform_key_name", "[optrust::specs]")
    {
        STATIC_REQUIRE(platform_key_name(PlatformKey::linux_amd64) == "linux_amd64");
        STATIC_REQUIRE(platform_key_name(PlatformKey::windows_amd64) == "windows_amd64");

        STATIC_REQUIRE(known_platform_keys_count() == 5);
        STATIC_REQUIRE(known_platform_keys().front() == PlatformKey::linux_amd64);
        STATIC_REQUIRE(known_platform_key_names().back() == "windows_amd64");
    }

    TEST_CASE("platform_key_parse", "[optrust::specs]")
    {
        for (const auto key : known_platform_keys())
        {
            REQUIRE(platform_key_parse(platform_key_name(key)) == key);
        }

        REQUIRE_FALSE(platform_key_parse("").has_value());
        REQUIRE_FALSE(platform_key_parse("Linux_amd64").has_value());
        REQUIRE_FALSE(platform_key_parse("windows_arm64").has_value());
        REQUIRE_FALSE(platform_key_parse(" linux_amd64").has_value());
    }

    TEST_CASE("resolve_platform_key", "[optrust::specs]")
    {
        SECTION("Supported pairs")
        {
            const auto supported = std::array{
                std::pair{ std::pair{ "linux", "amd64" }, PlatformKey::linux_amd64 },
                std::pair{ std::pair{ "linux", "arm64" }, PlatformKey::linux_arm64 },
                std::pair{ std::pair{ "darwin", "amd64" }, PlatformKey::darwin_amd64 },
                std::pair{ std::pair{ "darwin", "arm64" }, PlatformKey::darwin_arm64 },
                std::pair{ std::pair{ "windows", "amd64" }, PlatformKey::windows_amd64 },
            };
            for (const auto& [os_arch, key] : supported)
            {
                const auto resolved = resolve_platform_key(os_arch.first, os_arch.second);
                REQUIRE(resolved.has_value());
                REQUIRE(resolved.value() == key);
            }
        }

        SECTION("Closed matrix")
        {
            const auto oses = std::array<std::string_view, 5>{ "linux", "darwin", "windows", "freebsd", "" };
            const auto arches = std::array<std::string_view, 5>{ "amd64", "arm64", "386", "arm", "" };

            std::size_t resolved_count = 0;
            for (const auto os : oses)
            {
                for (const auto arch : arches)
                {
                    if (resolve_platform_key(os, arch).has_value())
                    {
                        ++resolved_count;
                    }
                }
            }
            REQUIRE(resolved_count == known_platform_keys_count());
        }

        SECTION("Windows on arm64")
        {
            const auto resolved = resolve_platform_key("windows", "arm64");
            REQUIRE_FALSE(resolved.has_value());
            REQUIRE(resolved.error().error_code() == optrust_error_code::unsupported_platform);
            REQUIRE(std::string_view(resolved.error().what()) == "unsupported platform: windows_arm64");

            const auto& details = UnsupportedPlatformError::get_details(resolved.error());
            REQUIRE(details.os == "windows");
            REQUIRE(details.arch == "arm64");
        }

        SECTION("Identifiers are case sensitive")
        {
            REQUIRE_FALSE(resolve_platform_key("Linux", "amd64").has_value());
            REQUIRE_FALSE(resolve_platform_key("linux", "AMD64").has_value());
            REQUIRE_FALSE(resolve_platform_key("linux", "x86_64").has_value());
        }
    }

    TEST_CASE("host platform", "[optrust::specs]")
    {
        REQUIRE_FALSE(host_os().empty());
        REQUIRE_FALSE(host_arch().empty());

#if defined(__linux__) && defined(__x86_64__)
        REQUIRE(resolve_platform_key(host_os(), host_arch()) == PlatformKey::linux_amd64);
#endif
    }
}

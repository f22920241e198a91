// Copyright (c) 2025, optrust Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <stdexcept>
#include <string>

#include <catch2/catch_all.hpp>

#include "optrust/registry/registry.hpp"
#include "optrust/registry/validation.hpp"

using namespace optrust;
using namespace optrust::registry;
using specs::PlatformKey;

namespace
{
    const std::string digest_a = "0fd8da9c6b6301781f50ef57cebbfd7d42d072777bcb4649ef5b6d360629b876";
    const std::string digest_b = "47bcd4dbeacefcd01ae8c913e61721ae71ac4f6a0b9150f48467ff719d494ff7";

    auto make_registry() -> Registry
    {
        auto registry = Registry{ .schema_version = supported_schema_version };
        registry.versions["2.31.1"].linux_amd64 = digest_a;
        registry.versions["2.31.1"].darwin_arm64 = digest_b;
        return registry;
    }

    TEST_CASE("PlatformChecksums", "[optrust::registry]")
    {
        auto checksums = PlatformChecksums();
        REQUIRE_FALSE(checksums.has_any());

        checksums.get(PlatformKey::windows_amd64) = digest_a;
        REQUIRE(checksums.windows_amd64 == digest_a);
        REQUIRE(checksums.has_any());

        checksums.windows_amd64 = " \t";
        REQUIRE_FALSE(checksums.has_any());

        REQUIRE_THROWS_AS(checksums.get(PlatformKey::count_), std::invalid_argument);
    }

    TEST_CASE("normalize_version", "[optrust::registry]")
    {
        REQUIRE(normalize_version("2.31.1") == "2.31.1");
        REQUIRE(normalize_version("v2.31.1") == "2.31.1");
        REQUIRE(normalize_version("  v2.31.1\n") == "2.31.1");
        REQUIRE(normalize_version("vv2.31.1") == "v2.31.1");
        REQUIRE(normalize_version("V2.31.1") == "V2.31.1");
        REQUIRE(normalize_version("") == "");
    }

    TEST_CASE("normalize_version_keys", "[optrust::registry]")
    {
        auto registry = make_registry();
        registry.versions[" v2.30.0"].linux_arm64 = digest_b;
        normalize_version_keys(registry);

        REQUIRE(registry.versions.size() == 2);
        REQUIRE(registry.versions.contains("2.30.0"));
        REQUIRE(registry.versions.at("2.30.0").linux_arm64 == digest_b);
    }

    TEST_CASE("get_expected_digest", "[optrust::registry]")
    {
        const auto registry = make_registry();

        SECTION("Found")
        {
            REQUIRE(get_expected_digest(registry, "2.31.1", PlatformKey::linux_amd64) == digest_a);
            REQUIRE(get_expected_digest(registry, "2.31.1", "darwin_arm64") == digest_b);
        }

        SECTION("Leading v is equivalent")
        {
            for (const auto key : specs::known_platform_keys())
            {
                REQUIRE(
                    get_expected_digest(registry, "v2.31.1", key)
                    == get_expected_digest(registry, "2.31.1", key)
                );
            }
            REQUIRE(get_expected_digest(registry, " v2.31.1 ", PlatformKey::linux_amd64) == digest_a);
        }

        SECTION("Not found")
        {
            REQUIRE_FALSE(get_expected_digest(registry, "2.31.0", PlatformKey::linux_amd64).has_value());
            REQUIRE_FALSE(get_expected_digest(registry, "2.31.1", PlatformKey::windows_amd64).has_value());
            REQUIRE_FALSE(get_expected_digest(registry, "2.31.1", "freebsd_amd64").has_value());
            REQUIRE_FALSE(get_expected_digest(registry, "2.31.1", "").has_value());
        }

        SECTION("Blank digest")
        {
            auto blank = registry;
            blank.versions["2.31.1"].linux_arm64 = "  ";
            REQUIRE_FALSE(get_expected_digest(blank, "2.31.1", PlatformKey::linux_arm64).has_value());
        }
    }

    TEST_CASE("extend_registry", "[optrust::registry]")
    {
        auto registry = make_registry();

        SECTION("New version")
        {
            auto checksums = PlatformChecksums();
            checksums.windows_amd64 = digest_b;
            REQUIRE(extend_registry(registry, "v3.0.0", checksums).has_value());

            REQUIRE(registry.versions.size() == 2);
            REQUIRE(registry.versions.contains("3.0.0"));
            REQUIRE_FALSE(registry.versions.contains("v3.0.0"));
            REQUIRE(get_expected_digest(registry, "3.0.0", PlatformKey::windows_amd64) == digest_b);
            REQUIRE(validate_registry(registry).has_value());
        }

        SECTION("Existing version is replaced")
        {
            auto checksums = PlatformChecksums();
            checksums.linux_arm64 = digest_a;
            REQUIRE(extend_registry(registry, "2.31.1", checksums).has_value());

            REQUIRE(registry.versions.size() == 1);
            REQUIRE(registry.versions.at("2.31.1") == checksums);
            REQUIRE_FALSE(get_expected_digest(registry, "2.31.1", PlatformKey::linux_amd64).has_value());
        }

        SECTION("Invalid entry leaves the registry untouched")
        {
            const auto before = registry;

            auto bad_digest = PlatformChecksums();
            bad_digest.linux_amd64 = "not-a-digest";
            const auto res1 = extend_registry(registry, "3.0.0", bad_digest);
            REQUIRE_FALSE(res1.has_value());
            REQUIRE(res1.error().error_code() == optrust_error_code::registry_validation);
            REQUIRE(registry == before);

            const auto res2 = extend_registry(registry, "3.0.0", PlatformChecksums());
            REQUIRE_FALSE(res2.has_value());
            REQUIRE(registry == before);

            auto good_digest = PlatformChecksums();
            good_digest.linux_amd64 = digest_a;
            const auto res3 = extend_registry(registry, "3.0", good_digest);
            REQUIRE_FALSE(res3.has_value());
            const auto& violations = RegistryValidationError::get_details(res3.error()).violations;
            REQUIRE(violations.size() == 1);
            REQUIRE(violations.front().kind == violation_kind::invalid_version_key);
            REQUIRE(registry == before);
        }

        SECTION("Schema version of the registry is used")
        {
            registry.schema_version = 2;
            const auto before = registry;

            auto checksums = PlatformChecksums();
            checksums.linux_amd64 = digest_a;
            const auto res = extend_registry(registry, "3.0.0", checksums);
            REQUIRE_FALSE(res.has_value());
            REQUIRE(registry == before);
        }
    }
}

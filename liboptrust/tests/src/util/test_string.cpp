// Copyright (c) 2025, optrust Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <array>
#include <string>
#include <string_view>
#include <vector>

#include <catch2/catch_all.hpp>

#include "optrust/util/string.hpp"

using namespace optrust::util;

namespace
{
    TEST_CASE("is_lower_hex", "[optrust::util]")
    {
        for (const char c : std::string_view("0123456789abcdef"))
        {
            REQUIRE(is_lower_hex(c));
        }
        for (const char c : std::string_view("ABCDEFgz -."))
        {
            REQUIRE_FALSE(is_lower_hex(c));
        }
    }

    TEST_CASE("to_lower", "[optrust::util]")
    {
        REQUIRE(to_lower('A') == 'a');
        REQUIRE(to_lower('z') == 'z');
        REQUIRE(to_lower('0') == '0');
        REQUIRE(to_lower("BA7816bF") == "ba7816bf");
        REQUIRE(to_lower("") == "");
    }

    TEST_CASE("split_prefix", "[optrust::util]")
    {
        using Out = std::array<std::string_view, 2>;

        REQUIRE(split_prefix("", 'v') == Out{ "", "" });
        REQUIRE(split_prefix("v", 'v') == Out{ "v", "" });
        REQUIRE(split_prefix("v2.31.1", 'v') == Out{ "v", "2.31.1" });
        REQUIRE(split_prefix("2.31.1", 'v') == Out{ "", "2.31.1" });
        REQUIRE(split_prefix("vv1", 'v') == Out{ "v", "v1" });
    }

    TEST_CASE("remove_prefix", "[optrust::util]")
    {
        REQUIRE(remove_prefix("", 'v') == "");
        REQUIRE(remove_prefix("v2.31.1", 'v') == "2.31.1");
        REQUIRE(remove_prefix("2.31.1", 'v') == "2.31.1");
        REQUIRE(remove_prefix("V2.31.1", 'v') == "V2.31.1");
    }

    TEST_CASE("strip", "[optrust::util]")
    {
        REQUIRE(strip("") == "");
        REQUIRE(strip(" \t\r\n") == "");
        REQUIRE(strip("  2.31.1") == "2.31.1");
        REQUIRE(strip("2.31.1\n") == "2.31.1");
        REQUIRE(strip(" a b ") == "a b");
    }

    TEST_CASE("join", "[optrust::util]")
    {
        REQUIRE(join(", ", std::vector<std::string>{}) == "");
        REQUIRE(join(", ", std::vector<std::string>{ "a" }) == "a");
        REQUIRE(join("; ", std::array<std::string_view, 3>{ "a", "b", "c" }) == "a; b; c");
    }
}

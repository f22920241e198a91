// Copyright (c) 2025, optrust Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <any>
#include <string>

#include <catch2/catch_all.hpp>

#include "optrust/core/error_handling.hpp"

using namespace optrust;

namespace
{
    auto parse_positive(int value) -> expected_t<int>
    {
        if (value > 0)
        {
            return value;
        }
        return make_unexpected("value is not positive", optrust_error_code::incorrect_usage, std::any(value));
    }

    auto twice_positive(int value) -> expected_t<int>
    {
        auto res = parse_positive(value);
        if (!res)
        {
            return forward_error(res);
        }
        return 2 * res.value();
    }

    TEST_CASE("optrust_error", "[optrust::core]")
    {
        const auto error = optrust_error("boom", optrust_error_code::registry_read);
        REQUIRE(std::string(error.what()) == "boom");
        REQUIRE(error.error_code() == optrust_error_code::registry_read);
        REQUIRE_FALSE(error.data().has_value());

        const auto with_data = optrust_error(std::string("boom"), optrust_error_code::unknown, std::any(3));
        REQUIRE(std::any_cast<int>(with_data.data()) == 3);
    }

    TEST_CASE("forward_error", "[optrust::core]")
    {
        REQUIRE(twice_positive(2) == 4);

        const auto res = twice_positive(-1);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().error_code() == optrust_error_code::incorrect_usage);
        REQUIRE(std::any_cast<int>(res.error().data()) == -1);
    }

    TEST_CASE("extract", "[optrust::core]")
    {
        REQUIRE(extract(parse_positive(1)) == 1);
        REQUIRE_THROWS_AS(extract(parse_positive(0)), optrust_error);

        const auto res = parse_positive(0);
        REQUIRE_THROWS_WITH(extract(res), "value is not positive");
    }
}

/*
 * Copyright (c) 2025-present
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "utils/Utils.hpp"
#include <catch2/catch.hpp>
#include <nlohmann/json.hpp>
#include <stdexcept>

using json = nlohmann::json;

TEST_CASE("sha1Hex produces the lower-case hex digest", "[utils]")
{
    REQUIRE(utils::sha1Hex("abc") == "a9993e364706816aba3e25717850c26c9cd0d89d");
    REQUIRE(utils::sha1Hex("").size() == 40);
}

TEST_CASE("generateMacAddress keeps the OUI prefix", "[utils]")
{
    auto mac = utils::generateMacAddress();
    REQUIRE(mac.size() == 17);
    REQUIRE(mac.rfind("fa:16:3e:", 0) == 0);
}

TEST_CASE("generateUuid returns distinct uuid strings", "[utils]")
{
    auto first = utils::generateUuid();
    auto second = utils::generateUuid();
    REQUIRE(first.size() == 36);
    REQUIRE(first != second);
}

TEST_CASE("splitString keeps empty fields", "[utils]")
{
    REQUIRE(utils::splitString("a:b", ':') == std::vector<std::string>{"a", "b"});
    REQUIRE(utils::splitString("a::b:", ':') == std::vector<std::string>{"a", "", "b", ""});
}

TEST_CASE("parseIntStrict rejects partial numbers", "[utils]")
{
    REQUIRE(utils::parseIntStrict("443") == 443);
    REQUIRE(utils::parseIntStrict("-1") == -1);
    REQUIRE_THROWS_AS(utils::parseIntStrict(""), std::invalid_argument);
    REQUIRE_THROWS_AS(utils::parseIntStrict("12a"), std::invalid_argument);
    REQUIRE_THROWS_AS(utils::parseIntStrict("abc"), std::invalid_argument);
    REQUIRE_THROWS_AS(utils::parseIntStrict("99999999999999"), std::invalid_argument);
}

TEST_CASE("parseIntStrict rejects signs and padding std::stoi would skip", "[utils]")
{
    REQUIRE_THROWS_AS(utils::parseIntStrict(" 80"), std::invalid_argument);
    REQUIRE_THROWS_AS(utils::parseIntStrict("\t80"), std::invalid_argument);
    REQUIRE_THROWS_AS(utils::parseIntStrict("+80"), std::invalid_argument);
    REQUIRE_THROWS_AS(utils::parseIntStrict("-"), std::invalid_argument);
    REQUIRE_THROWS_AS(utils::parseIntStrict("- 1"), std::invalid_argument);
    REQUIRE(utils::parseIntStrict("0080") == 80);
}

TEST_CASE("truncateDisplayName caps names at the controller limit", "[utils]")
{
    std::string longName(60, 'n');
    REQUIRE(utils::truncateDisplayName(longName).size() == utils::MAX_DISPLAY_NAME_LEN);
    REQUIRE(utils::truncateDisplayName("short") == "short");
}

TEST_CASE("truncateDisplayName never splits a multi-byte character", "[utils]")
{
    SECTION("two-byte character straddling the limit is dropped")
    {
        const std::string name = std::string(39, 'a') + "\xc3\xa9";
        const std::string truncated = utils::truncateDisplayName(name);
        REQUIRE(truncated == std::string(39, 'a'));
        REQUIRE_NOTHROW(json(truncated).dump());
    }

    SECTION("character ending exactly at the limit is kept")
    {
        const std::string name = std::string(38, 'a') + "\xc3\xa9" + "tail";
        REQUIRE(utils::truncateDisplayName(name) == std::string(38, 'a') + "\xc3\xa9");
    }

    SECTION("four-byte character straddling the limit is dropped")
    {
        const std::string name = std::string(37, 'a') + "\xf0\x9f\x98\x80";
        REQUIRE(utils::truncateDisplayName(name) == std::string(37, 'a'));
    }
}

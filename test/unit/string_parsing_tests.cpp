// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Unit tests for string parsing utilities

#include "util/string_parsing.hpp"
#include <catch2/catch_test_macros.hpp>
#include <limits>

using namespace orderwatch::util;

TEST_CASE("SafeParseInt - valid inputs", "[util][string_parsing]") {
    SECTION("Parse valid positive integer") {
        auto result = SafeParseInt("42", 0, 100);
        REQUIRE(result.has_value());
        REQUIRE(*result == 42);
    }

    SECTION("Parse valid negative integer") {
        auto result = SafeParseInt("-50", -100, 100);
        REQUIRE(result.has_value());
        REQUIRE(*result == -50);
    }

    SECTION("Parse at bounds") {
        REQUIRE(SafeParseInt("0", 0, 100) == 0);
        REQUIRE(SafeParseInt("100", 0, 100) == 100);
    }
}

TEST_CASE("SafeParseInt - invalid inputs", "[util][string_parsing]") {
    SECTION("Out of range") {
        REQUIRE_FALSE(SafeParseInt("101", 0, 100).has_value());
        REQUIRE_FALSE(SafeParseInt("-1", 0, 100).has_value());
    }

    SECTION("Trailing and leading garbage") {
        REQUIRE_FALSE(SafeParseInt("42x", 0, 100).has_value());
        REQUIRE_FALSE(SafeParseInt(" 42", 0, 100).has_value());
        REQUIRE_FALSE(SafeParseInt("+42", 0, 100).has_value());
    }

    SECTION("Empty string") {
        REQUIRE_FALSE(SafeParseInt("", 0, 100).has_value());
    }

    SECTION("Overflow of the underlying type") {
        REQUIRE_FALSE(SafeParseInt("99999999999999999999", std::numeric_limits<int>::min(),
                                   std::numeric_limits<int>::max()).has_value());
    }
}

TEST_CASE("SafeParseInt64 - wide values", "[util][string_parsing]") {
    auto result = SafeParseInt64("3600000", 1, 3600000);
    REQUIRE(result.has_value());
    REQUIRE(*result == 3600000);
    REQUIRE_FALSE(SafeParseInt64("3600001", 1, 3600000).has_value());
}

TEST_CASE("SafeParseQuantity - JSON-RPC hex quantities", "[util][string_parsing][rpc]") {
    SECTION("Valid quantities") {
        REQUIRE(SafeParseQuantity("0x0") == 0u);
        REQUIRE(SafeParseQuantity("0x1b4") == 436u);
        REQUIRE(SafeParseQuantity("0X1B4") == 436u);
        REQUIRE(SafeParseQuantity("0x00ff") == 255u);
        REQUIRE(SafeParseQuantity("0xffffffffffffffff") == std::numeric_limits<uint64_t>::max());
    }

    SECTION("Rejected forms") {
        REQUIRE_FALSE(SafeParseQuantity("1b4").has_value());
        REQUIRE_FALSE(SafeParseQuantity("0x").has_value());
        REQUIRE_FALSE(SafeParseQuantity("").has_value());
        REQUIRE_FALSE(SafeParseQuantity("0xzz").has_value());
        REQUIRE_FALSE(SafeParseQuantity("0x10000000000000000").has_value());
    }
}

TEST_CASE("SafeParseUint256 - token amounts", "[util][string_parsing]") {
    SECTION("Decimal") {
        auto v = SafeParseUint256("1000000000000000000");
        REQUIRE(v.has_value());
        REQUIRE(FormatUint256(*v) == "1000000000000000000");
        // 10^18 = 0x0de0b6b3a7640000
        REQUIRE(v->data()[31] == 0x00);
        REQUIRE(v->data()[24] == 0x0d);
    }

    SECTION("Hex") {
        auto v = SafeParseUint256("0xff");
        REQUIRE(v.has_value());
        REQUIRE(v->data()[31] == 0xff);
        REQUIRE(FormatUint256(*v) == "255");
    }

    SECTION("Maximum value and one past it") {
        const std::string max_dec =
            "115792089237316195423570985008687907853269984665640564039457584007913129639935";
        auto v = SafeParseUint256(max_dec);
        REQUIRE(v.has_value());
        REQUIRE(FormatUint256(*v) == max_dec);
        REQUIRE_FALSE(SafeParseUint256(
            "115792089237316195423570985008687907853269984665640564039457584007913129639936").has_value());
    }

    SECTION("Rejected forms") {
        REQUIRE_FALSE(SafeParseUint256("-1").has_value());
        REQUIRE_FALSE(SafeParseUint256("").has_value());
        REQUIRE_FALSE(SafeParseUint256("0x").has_value());
        REQUIRE_FALSE(SafeParseUint256("12a").has_value());
    }

    SECTION("Zero formats as a single digit") {
        REQUIRE(FormatUint256(uint256()) == "0");
    }
}

TEST_CASE("IsValidHex", "[util][string_parsing]") {
    REQUIRE(IsValidHex("deadBEEF09"));
    REQUIRE_FALSE(IsValidHex(""));
    REQUIRE_FALSE(IsValidHex("0x12"));
    REQUIRE_FALSE(IsValidHex("12 34"));
}

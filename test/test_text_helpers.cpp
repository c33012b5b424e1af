/**
 * @file test_text_helpers.cpp
 * @brief Unit tests for TextHelper and the write response interpreter
 * @version 0.1
 * @date 2026-10-18
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <cstdint>
#include <vector>

#include "../include/interface/text_helpers.hpp"
#include "../include/protocol/response_interpreter.hpp"

using namespace tefmem;
using Catch::Matchers::ContainsSubstring;

namespace {

    std::string decode(const std::vector<std::uint8_t>& bytes) {
        return TextHelper::decode_permissive(
            boost::span<const std::uint8_t>(bytes.data(), bytes.size()));
    }

} // namespace

TEST_CASE("TextHelper::decode_permissive - UTF-8 handling", "[text]") {
    SECTION("Valid ASCII and multi-byte text pass through") {
        REQUIRE(decode({'r', ':', 'T', 'E', 'F'}) == "r:TEF");
        REQUIRE(decode({0xC3, 0xA9}) == "\xC3\xA9");
        REQUIRE(decode({0xE2, 0x82, 0xAC}) == "\xE2\x82\xAC");
    }

    SECTION("Invalid bytes become U+FFFD") {
        REQUIRE(decode({'A', 0xFF, 'B'}) == "A\xEF\xBF\xBD" "B");
        REQUIRE(decode({0xC3}) == "\xEF\xBF\xBD");
    }
}

TEST_CASE("TextHelper - Field helpers", "[text]") {
    SECTION("trim strips whitespace and CR") {
        REQUIRE(TextHelper::trim("  S:128\r") == "S:128");
        REQUIRE(TextHelper::trim(" \t\r\n").empty());
    }

    SECTION("split keeps empty fields") {
        auto parts = TextHelper::split("2,98300,0,1,,", ',');
        REQUIRE(parts.size() == 6);
        REQUIRE(parts[4].empty());
        REQUIRE(parts[5].empty());
    }

    SECTION("truncate counts characters, not bytes") {
        std::string ps = "\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9";  // 5 x U+00E9
        REQUIRE(TextHelper::truncate(ps, 4));
        REQUIRE(ps == "\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9");

        std::string pi = "D3A2";
        REQUIRE_FALSE(TextHelper::truncate(pi, 4));
        REQUIRE(pi == "D3A2");
    }

    SECTION("parse_int is strict") {
        REQUIRE(TextHelper::parse_int(" 42 ") == 42);
        REQUIRE(TextHelper::parse_int("-3") == -3);
        REQUIRE_FALSE(TextHelper::parse_int("").has_value());
        REQUIRE_FALSE(TextHelper::parse_int("12a").has_value());
        REQUIRE_FALSE(TextHelper::parse_int("1.5").has_value());
        REQUIRE_FALSE(TextHelper::parse_int("99999999999").has_value());
    }
}

TEST_CASE("interpret_write_response - Status bits", "[protocol][response]") {
    SECTION("Code 128 is a plain success") {
        auto r = interpret_write_response(128);
        REQUIRE(r.success);
        REQUIRE(r.messages == std::vector<std::string>{"All ok, channel stored"});
    }

    SECTION("Code 133 reports success first, then bits 0 and 2") {
        auto r = interpret_write_response(133);
        REQUIRE(r.success);
        REQUIRE(r.messages == std::vector<std::string>{
            "All ok, channel stored", "Frequency out of range", "Bandwidth out of range"});
    }

    SECTION("Every failure bit is reported") {
        auto r = interpret_write_response(0x7F);
        REQUIRE_FALSE(r.success);
        REQUIRE(r.messages.size() == 7);
        REQUIRE(r.messages[4] == "Memory channel 1 can't be set to skip");
        REQUIRE(r.messages[5] == "Incorrect PI code");
    }

    SECTION("Code 0") {
        auto r = interpret_write_response(0);
        REQUIRE_FALSE(r.success);
        REQUIRE(r.messages == std::vector<std::string>{"No status bits set (Code 0)"});
    }

    SECTION("Code without known bits") {
        auto r = interpret_write_response(256);
        REQUIRE_FALSE(r.success);
        REQUIRE(r.messages.size() == 1);
        REQUIRE_THAT(r.messages[0], ContainsSubstring("Unknown response code: 256"));
        REQUIRE_THAT(r.messages[0], ContainsSubstring("100000000"));
    }
}

TEST_CASE("parse_write_response - Reply line shapes", "[protocol][response]") {
    REQUIRE(parse_write_response("S:128") == 128);
    REQUIRE(parse_write_response("  S: 133\r") == 133);
    REQUIRE_FALSE(parse_write_response("S:abc").has_value());
    REQUIRE_FALSE(parse_write_response("OK").has_value());
    REQUIRE_FALSE(parse_write_response("").has_value());
}

/**
 * @file test_ean13_code.cpp
 * @brief Unit tests for the validated Ean13Code value type
 * @version 1.0
 * @date 2026-10-19
 */

#include <catch2/catch_test_macros.hpp>
#include <set>
#include <unordered_set>

#include "../include/code/ean13_code.hpp"
#include "../include/exception/ean13_exception.hpp"
#include "test_utils.hpp"

using namespace ean13;
using ean13::test::digits_of;

TEST_CASE("Ean13Code::from_string - Valid codes", "[code]") {
    auto code = Ean13Code::from_string("4006381333931");

    REQUIRE(code.to_string() == "4006381333931");
    REQUIRE(code.first_digit() == 4);
    REQUIRE(code.check_digit() == 1);
    REQUIRE(code[5] == 8);
    REQUIRE(code.payload().size() == PAYLOAD_LENGTH);
    REQUIRE(code.to_integer() == 4006381333931ULL);
}

TEST_CASE("Ean13Code::from_string - Invalid input", "[code][validation]") {
    SECTION("Wrong length") {
        try {
            Ean13Code::from_string("400638133393");
            REQUIRE(false);
        } catch (const InvalidDigitError& e) {
            REQUIRE(e.status() == Status::WBAD_LENGTH);
        }
    }

    SECTION("Non-digit character") {
        try {
            Ean13Code::from_string("40063813339A1");
            REQUIRE(false);
        } catch (const InvalidDigitError& e) {
            REQUIRE(e.status() == Status::WBAD_DIGIT);
        }
    }

    SECTION("Wrong check digit") {
        try {
            Ean13Code::from_string("4006381333932");
            REQUIRE(false);
        } catch (const ChecksumMismatchError& e) {
            REQUIRE(e.status() == Status::WBAD_CHECKSUM);
            REQUIRE(e.context().find("expected 1") != std::string::npos);
        }
    }
}

TEST_CASE("Ean13Code::from_digits - Validation", "[code][validation]") {
    REQUIRE(Ean13Code::from_digits(digits_of("4006381012935")).to_string() == "4006381012935");
    REQUIRE_THROWS_AS(Ean13Code::from_digits(digits_of("4006381012936")), ChecksumMismatchError);
    REQUIRE_THROWS_AS(Ean13Code::from_digits(digits_of("400638101293")), InvalidDigitError);
}

TEST_CASE("Ean13Code - Display string groups the digits", "[code]") {
    REQUIRE(Ean13Code::from_string("4006381333931").to_display_string() == "4 006381 333931");
    REQUIRE(Ean13Code::from_string("0000000000000").to_display_string() == "0 000000 000000");
}

TEST_CASE("Ean13Code - Comparison and hashing", "[code]") {
    auto a = Ean13Code::from_string("4006381333931");
    auto b = Ean13Code::from_string("4006381333931");
    auto c = Ean13Code::from_string("4006381012935");

    REQUIRE(a == b);
    REQUIRE(a != c);
    REQUIRE(c < a);

    std::unordered_set<Ean13Code> hashed = {a, b, c};
    REQUIRE(hashed.size() == 2);

    std::set<Ean13Code> ordered = {a, c};
    REQUIRE(ordered.begin()->to_string() == "4006381012935");
}

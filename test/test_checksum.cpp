/**
 * @file test_checksum.cpp
 * @brief Unit tests for the EAN13 check digit
 * @version 1.0
 * @date 2026-10-19
 */

#include <catch2/catch_test_macros.hpp>
#include <array>
#include <vector>

#include "../include/interface/checksum.hpp"
#include "../include/exception/ean13_exception.hpp"
#include "test_utils.hpp"

using namespace ean13;
using ean13::test::digits_of;

TEST_CASE("Checksum::compute - Known payloads", "[checksum]") {
    REQUIRE(Checksum::compute(digits_of("400638101293")) == 5);
    REQUIRE(Checksum::compute(digits_of("400638133393")) == 1);
    REQUIRE(Checksum::compute(digits_of("590123412345")) == 7);
    REQUIRE(Checksum::compute(digits_of("978020137962")) == 4);
    REQUIRE(Checksum::compute(digits_of("123456789012")) == 8);
    REQUIRE(Checksum::compute(digits_of("871125300120")) == 2);
}

TEST_CASE("Checksum::compute - All zeros gives zero", "[checksum]") {
    std::array<Digit, PAYLOAD_LENGTH> zeros{};
    REQUIRE(Checksum::compute(zeros) == 0);
}

TEST_CASE("Checksum::compute - Weights 1 and 3 alternate from the left", "[checksum]") {
    // Only position 0 set: weight 1
    REQUIRE(Checksum::compute(digits_of("100000000000")) == 9);
    // Only position 1 set: weight 3
    REQUIRE(Checksum::compute(digits_of("010000000000")) == 7);
    // Sum exactly 10: check digit wraps to 0
    REQUIRE(Checksum::compute(digits_of("910000000000")) == 8);
    REQUIRE(Checksum::compute(digits_of("550000000000")) == 0);
}

TEST_CASE("Checksum::compute - Invalid input", "[checksum][validation]") {
    SECTION("Too short") {
        REQUIRE_THROWS_AS(Checksum::compute(digits_of("40063810129")), InvalidDigitError);
    }

    SECTION("Too long") {
        REQUIRE_THROWS_AS(Checksum::compute(digits_of("4006381012935")), InvalidDigitError);
    }

    SECTION("Digit out of range") {
        std::vector<Digit> payload = digits_of("400638101293");
        payload[4] = 10;
        try {
            Checksum::compute(payload);
            REQUIRE(false);
        } catch (const InvalidDigitError& e) {
            REQUIRE(e.status() == Status::WBAD_DIGIT);
        }
    }
}

TEST_CASE("Checksum::verify - Valid and corrupted codes", "[checksum]") {
    REQUIRE(Checksum::verify(digits_of("4006381012935")));
    REQUIRE(Checksum::verify(digits_of("4006381333931")));
    REQUIRE(Checksum::verify(digits_of("0000000000000")));

    REQUIRE_FALSE(Checksum::verify(digits_of("4006381012934")));
    REQUIRE_FALSE(Checksum::verify(digits_of("4006381333930")));

    SECTION("Any single-digit substitution is detected") {
        const auto good = digits_of("4006381333931");
        for (std::size_t i = 0; i < CODE_LENGTH; ++i) {
            for (Digit d = 0; d <= 9; ++d) {
                if (d == good[i]) continue;
                auto bad = good;
                bad[i] = d;
                REQUIRE_FALSE(Checksum::verify(bad));
            }
        }
    }

    SECTION("Wrong length throws") {
        REQUIRE_THROWS_AS(Checksum::verify(digits_of("400638101293")), InvalidDigitError);
    }
}

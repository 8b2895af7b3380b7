/**
 * @file test_constraint_builder.cpp
 * @brief Unit tests for Constraint and its fluent builder
 * @version 1.0
 * @date 2026-10-19
 */

#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <stdexcept>

#include "../include/pattern/constraint_builder.hpp"
#include "../include/io/memory_exclusion_set.hpp"
#include "../include/exception/ean13_exception.hpp"

using namespace ean13;

TEST_CASE("ConstraintBuilder - Defaults", "[constraint][builder]") {
    auto constraint = make_constraint().build();

    REQUIRE(constraint.prefix.empty());
    REQUIRE(constraint.exclusion == nullptr);
    REQUIRE(constraint.max_attempts == DEFAULT_MAX_ATTEMPTS);
    REQUIRE(constraint.sequential_threshold == DEFAULT_SEQUENTIAL_THRESHOLD);
    REQUIRE_FALSE(constraint.time_budget.has_value());
    REQUIRE(constraint.free_digits() == 12);
}

TEST_CASE("ConstraintBuilder - Sets every field", "[constraint][builder]") {
    MemoryExclusionSet taken;
    auto constraint = make_constraint()
        .with_prefix("400638")
        .with_exclusion(taken)
        .with_max_attempts(500)
        .with_time_budget(std::chrono::milliseconds(250))
        .with_sequential_threshold(10)
        .build();

    REQUIRE(constraint.prefix_string() == "400638");
    REQUIRE(constraint.free_digits() == 6);
    REQUIRE(constraint.exclusion == &taken);
    REQUIRE(constraint.max_attempts == 500);
    REQUIRE(constraint.time_budget->count() == 250);
    REQUIRE(constraint.sequential_threshold == 10);
}

TEST_CASE("ConstraintBuilder - Prefix from digit values", "[constraint][builder]") {
    auto constraint = make_constraint().with_prefix(std::vector<Digit>{9, 7, 8}).build();
    REQUIRE(constraint.prefix_string() == "978");
}

TEST_CASE("parse_prefix - Validation", "[constraint][prefix]") {
    REQUIRE(parse_prefix("").empty());
    REQUIRE(parse_prefix("00000000000").size() == 11);

    SECTION("Twelve digits leave nothing to generate") {
        try {
            parse_prefix("400638133393");
            REQUIRE(false);
        } catch (const InvalidDigitError& e) {
            REQUIRE(e.status() == Status::WBAD_PREFIX);
        }
    }

    SECTION("Non-digit") {
        REQUIRE_THROWS_AS(parse_prefix("40a"), InvalidDigitError);
        REQUIRE_THROWS_AS(parse_prefix("-1"), InvalidDigitError);
        REQUIRE_THROWS_AS(make_constraint().with_prefix("4 0"), InvalidDigitError);
    }
}

TEST_CASE("Constraint::validate - Invalid constraints", "[constraint][validation]") {
    SECTION("Digit value above 9") {
        REQUIRE_THROWS_AS(make_constraint().with_prefix(std::vector<Digit>{4, 10}).build(),
            InvalidDigitError);
    }

    SECTION("Zero attempt budget") {
        REQUIRE_THROWS_AS(make_constraint().with_max_attempts(0).build(), std::invalid_argument);
    }

    SECTION("Non-positive time budget") {
        REQUIRE_THROWS_AS(make_constraint().with_time_budget(std::chrono::milliseconds(0)).build(),
            std::invalid_argument);
    }
}

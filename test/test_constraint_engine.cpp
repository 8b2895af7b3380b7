/**
 * @file test_constraint_engine.cpp
 * @brief Unit tests for constrained random generation
 * @version 1.0
 * @date 2026-10-19
 *
 * Test Strategy:
 * 1. Generated codes are valid and honor the prefix
 * 2. Excluded codes are never returned
 * 3. Budgets and full exclusion end in ExhaustedError
 * 4. The sequential scan finds the last free codes
 * 5. Batches are distinct and recorded in the store
 */

#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <set>
#include <thread>
#include <vector>

#include "../include/pattern/constraint_engine.hpp"
#include "../include/io/memory_exclusion_set.hpp"
#include "../include/interface/checksum.hpp"
#include "../include/interface/codec.hpp"
#include "../include/exception/ean13_exception.hpp"
#include "mocks/mock_exclusion_set.hpp"

using namespace ean13;
using ean13::test::MockExclusionSet;

namespace {

    // Every code whose payload starts with `prefix` and has `free` free digits
    std::vector<Ean13Code> all_codes(const std::string& prefix) {
        std::vector<Ean13Code> codes;
        const std::size_t free = PAYLOAD_LENGTH - prefix.size();
        std::uint64_t space = 1;
        for (std::size_t i = 0; i < free; ++i) space *= 10;
        for (std::uint64_t n = 0; n < space; ++n) {
            std::string suffix = std::to_string(n);
            suffix.insert(0, free - suffix.size(), '0');
            codes.push_back(Codec::encode(prefix + suffix));
        }
        return codes;
    }

} // namespace

TEST_CASE("ConstraintEngine::generate - Valid codes with prefix", "[engine]") {
    ConstraintEngine engine(42);
    auto constraint = make_constraint().with_prefix("400638").build();

    for (int i = 0; i < 100; ++i) {
        auto code = engine.generate(constraint);
        REQUIRE(code.to_string().substr(0, 6) == "400638");
        REQUIRE(Checksum::verify(code.digits()));
        REQUIRE(engine.last_stats().attempts == 1);
    }
}

TEST_CASE("ConstraintEngine::generate - Empty prefix", "[engine]") {
    ConstraintEngine engine(1);
    auto constraint = make_constraint().build();
    REQUIRE(ConstraintEngine::free_space(constraint) == 1000000000000ULL);

    std::set<Ean13Code> seen;
    for (int i = 0; i < 50; ++i) {
        seen.insert(engine.generate(constraint));
    }
    // Collisions among 50 draws from 10^12 are practically impossible
    REQUIRE(seen.size() == 50);
}

TEST_CASE("ConstraintEngine - Same seed, same sequence", "[engine][seed]") {
    auto constraint = make_constraint().with_prefix("20").build();
    ConstraintEngine a(1234);
    ConstraintEngine b(1234);
    ConstraintEngine c(4321);

    std::vector<Ean13Code> from_a, from_b, from_c;
    for (int i = 0; i < 10; ++i) {
        from_a.push_back(a.generate(constraint));
        from_b.push_back(b.generate(constraint));
        from_c.push_back(c.generate(constraint));
    }
    REQUIRE(from_a == from_b);
    REQUIRE(from_a != from_c);
}

TEST_CASE("ConstraintEngine - Never returns an excluded code", "[engine][exclusion]") {
    // Exclude 99 of the 100 codes with this prefix
    const auto codes = all_codes("4006381012");
    MemoryExclusionSet taken(std::vector<Ean13Code>(codes.begin(), codes.end() - 1));
    const Ean13Code free_code = codes.back();

    auto constraint = make_constraint()
        .with_prefix("4006381012")
        .with_exclusion(taken)
        .build();

    ConstraintEngine engine(7);
    for (int i = 0; i < 20; ++i) {
        REQUIRE(engine.generate(constraint) == free_code);
    }
}

TEST_CASE("ConstraintEngine - Sequential scan reaches the last free code", "[engine][scan]") {
    const auto codes = all_codes("40063810");
    MemoryExclusionSet taken(std::vector<Ean13Code>(codes.begin() + 1, codes.end()));

    auto constraint = make_constraint()
        .with_prefix("40063810")
        .with_exclusion(taken)
        .with_sequential_threshold(5)
        .build();

    ConstraintEngine engine(99);
    auto code = engine.generate(constraint);

    REQUIRE(code == codes.front());
    REQUIRE(engine.last_stats().attempts <= 5 + codes.size());
    REQUIRE(engine.last_stats().rejections == engine.last_stats().attempts - 1);
}

TEST_CASE("ConstraintEngine - Threshold 0 scans from the start", "[engine][scan]") {
    MockExclusionSet none;
    auto constraint = make_constraint()
        .with_prefix("12345678901")
        .with_exclusion(none)
        .with_sequential_threshold(0)
        .build();

    ConstraintEngine engine(3);
    auto code = engine.generate(constraint);
    REQUIRE(code.to_string().substr(0, 11) == "12345678901");
    REQUIRE(engine.last_stats().sequential_scan);
    REQUIRE(none.query_count() == 1);
}

TEST_CASE("ConstraintEngine - Fully excluded space fails fast", "[engine][exhausted]") {
    MockExclusionSet everything;
    everything.exclude_all();

    auto constraint = make_constraint()
        .with_prefix("4006381012")
        .with_exclusion(everything)
        .with_sequential_threshold(10)
        .build();

    ConstraintEngine engine(5);
    auto result = engine.try_generate(constraint);

    REQUIRE(result.fail());
    REQUIRE(result.error() == Status::GEXHAUSTED);
    REQUIRE(engine.last_stats().space_exhausted);
    // 10 random draws, then exactly one pass over the 100 candidates
    REQUIRE(engine.last_stats().attempts == 10 + 100);
    REQUIRE(everything.query_count() == 110);

    REQUIRE_THROWS_AS(engine.generate(constraint), ExhaustedError);
}

TEST_CASE("ConstraintEngine - Attempt budget", "[engine][exhausted]") {
    MockExclusionSet everything;
    everything.exclude_all();

    auto constraint = make_constraint()
        .with_exclusion(everything)
        .with_max_attempts(250)
        .build();

    ConstraintEngine engine(11);
    auto result = engine.try_generate(constraint);

    REQUIRE(result.error() == Status::GEXHAUSTED);
    REQUIRE(engine.last_stats().attempts == 250);
    REQUIRE_FALSE(engine.last_stats().space_exhausted);
    REQUIRE(everything.query_count() == 250);
}

TEST_CASE("ConstraintEngine - Time budget", "[engine][exhausted]") {
    // Slow rejection so the deadline passes long before the attempt budget
    MockExclusionSet slow([](const Ean13Code&) {
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
        return true;
    });

    auto constraint = make_constraint()
        .with_exclusion(slow)
        .with_time_budget(std::chrono::milliseconds(30))
        .build();

    ConstraintEngine engine(13);
    const auto start = std::chrono::steady_clock::now();
    REQUIRE_THROWS_AS(engine.generate(constraint), ExhaustedError);
    const auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(elapsed < std::chrono::seconds(2));
    REQUIRE(engine.last_stats().attempts < DEFAULT_MAX_ATTEMPTS);
}

TEST_CASE("ConstraintEngine - Invalid prefix", "[engine][validation]") {
    Constraint constraint;
    constraint.prefix = {4, 0, 0, 6, 3, 8, 1, 3, 3, 3, 9, 3};

    ConstraintEngine engine(1);
    auto result = engine.try_generate(constraint);
    REQUIRE(result.error() == Status::WBAD_PREFIX);
    REQUIRE_THROWS_AS(engine.generate(constraint), InvalidDigitError);

    constraint.prefix = {4, 11};
    REQUIRE_THROWS_AS(engine.generate(constraint), InvalidDigitError);
}

TEST_CASE("ConstraintEngine::generate_batch - Distinct codes recorded in the store",
    "[engine][batch]") {
    MemoryExclusionSet store;
    auto constraint = make_constraint().with_prefix("978020137").build();

    ConstraintEngine engine(21);
    auto codes = engine.generate_batch(constraint, 500, store);

    REQUIRE(codes.size() == 500);
    REQUIRE(std::set<Ean13Code>(codes.begin(), codes.end()).size() == 500);
    REQUIRE(store.size() == 500);
    for (const auto& code : codes) {
        REQUIRE(store.contains(code));
    }
}

TEST_CASE("ConstraintEngine::generate_batch - Exhausts the whole space", "[engine][batch]") {
    MemoryExclusionSet base = {Codec::encode("400638101200")};
    MemoryExclusionSet store;

    auto constraint = make_constraint()
        .with_prefix("4006381012")
        .with_exclusion(base)
        .with_sequential_threshold(20)
        .build();

    ConstraintEngine engine(8);
    auto codes = engine.generate_batch(constraint, 99, store);
    REQUIRE(codes.size() == 99);
    REQUIRE_FALSE(store.contains(Codec::encode("400638101200")));

    // The 100th code does not exist
    REQUIRE_THROWS_AS(engine.generate_batch(constraint, 1, store), ExhaustedError);
    REQUIRE(store.size() == 99);
}

TEST_CASE("ConstraintEngine - Independent engines on a shared store", "[engine][threads]") {
    MemoryExclusionSet store;
    auto constraint = make_constraint().with_prefix("5901234").build();

    std::vector<std::vector<Ean13Code>> results(4);
    std::vector<std::thread> workers;
    for (std::size_t t = 0; t < results.size(); ++t) {
        workers.emplace_back([&, t]() {
            ConstraintEngine engine(100 + t);
            results[t] = engine.generate_batch(constraint, 250, store);
        });
    }
    for (auto& w : workers) {
        w.join();
    }

    std::set<Ean13Code> all;
    for (const auto& r : results) {
        all.insert(r.begin(), r.end());
    }
    REQUIRE(all.size() == 1000);
    REQUIRE(store.size() == 1000);
}

TEST_CASE("GenerationStats - Text form", "[engine]") {
    GenerationStats stats;
    stats.attempts = 3;
    stats.rejections = 2;
    REQUIRE(stats.to_string() == "attempts=3 rejections=2 sequential_scan=no space_exhausted=no");
}

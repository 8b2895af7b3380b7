/**
 * @file constraint_engine.hpp
 * @brief Random generation of valid EAN13 codes under prefix and exclusion constraints
 * @version 1.0
 * @date 2026-10-19
 *
 * Search strategy:
 * 1. Draw the free payload digits uniformly at random.
 * 2. After `sequential_threshold` consecutive rejections, scan the free space
 *    in order from a random starting point, wrapping around.
 * 3. Stop with GEXHAUSTED when the attempt or time budget runs out, or as
 *    soon as the scan has visited the whole free space.
 *
 * Successive results have no ordering guarantee.
 *
 * @copyright Copyright (c) 2026
 */

#pragma once

#include <cstdint>
#include <random>
#include <string>
#include <vector>

#include "../code/ean13_code.hpp"
#include "../io/exclusion_set.hpp"
#include "../template/result.hpp"
#include "constraint_builder.hpp"

namespace ean13 {

    /// Outcome of one generation call: a fresh code or GEXHAUSTED
    using GenerationResult = Result<Ean13Code>;

    /**
     * @brief Counters describing the last generation call
     */
    struct GenerationStats {
        std::uint64_t attempts = 0;         // candidates evaluated
        std::uint64_t rejections = 0;       // candidates found in the exclusion set
        bool sequential_scan = false;       // fallback scan was engaged
        bool space_exhausted = false;       // scan visited the whole free space

        std::string to_string() const;
    };

    /**
     * @brief Constrained random code generator
     *
     * The engine never writes to the exclusion collaborator: after accepting a
     * code the caller records it (or uses generate_batch()). Each instance owns
     * its random engine; use one instance per thread.
     */
    class ConstraintEngine {
        public:
            /**
             * @brief Engine seeded from std::random_device
             */
            ConstraintEngine();

            /**
             * @brief Engine with a fixed seed, for reproducible runs
             */
            explicit ConstraintEngine(std::uint64_t seed);

            /**
             * @brief Generate one code
             * @param constraint Prefix, exclusion set and budgets
             * @return Ean13Code A code matching the prefix and absent from the exclusion set
             * @throws InvalidDigitError if the prefix is invalid
             * @throws ExhaustedError if the budget ran out or the free space is fully excluded
             */
            Ean13Code generate(const Constraint& constraint);

            /**
             * @brief Generate one code, reporting failures as a Result
             * @param constraint Prefix, exclusion set and budgets
             * @return GenerationResult The code, or WBAD_PREFIX / GEXHAUSTED
             */
            GenerationResult try_generate(const Constraint& constraint);

            /**
             * @brief Generate `count` distinct codes and record each in `store`
             *
             * Candidates must be absent from both the constraint's exclusion set
             * and `store`. Each accepted code is claimed with store.insert()
             * before the next draw, so the batch holds no duplicates even when
             * other generators share the store.
             *
             * @param constraint Prefix, exclusion set and per-code budgets
             * @param count Number of codes to produce
             * @param store Store receiving the accepted codes
             * @return std::vector<Ean13Code> The codes, in generation order
             * @throws ExhaustedError if a code cannot be found; codes already
             *         produced stay recorded in `store`
             */
            std::vector<Ean13Code> generate_batch(const Constraint& constraint, std::size_t count,
                IExclusionStore& store);

            /**
             * @brief Number of payloads matching the prefix, 10^(12 - prefix length)
             */
            static std::uint64_t free_space(const Constraint& constraint);

            const GenerationStats& last_stats() const { return stats_; }

        private:
            std::mt19937_64 rng_;
            GenerationStats stats_;

            std::uint64_t draw(std::uint64_t space);
    };

} // namespace ean13

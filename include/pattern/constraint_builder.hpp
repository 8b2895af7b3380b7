/**
 * @file constraint_builder.hpp
 * @brief Generation constraint and its fluent builder.
 *
 * Example Usage:
 * @code
 * MemoryExclusionSet taken = {...};
 * auto constraint = make_constraint()
 *     .with_prefix("400638")
 *     .with_exclusion(taken)
 *     .with_max_attempts(10000)
 *     .with_time_budget(std::chrono::milliseconds(250))
 *     .build();
 * @endcode
 *
 * @version 1.0
 * @date 2026-10-19
 * @copyright Copyright (c) 2026
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "../enums/symbology.hpp"
#include "../io/exclusion_set.hpp"

namespace ean13 {

    static constexpr std::uint64_t DEFAULT_MAX_ATTEMPTS = 1000000;
    static constexpr std::uint64_t DEFAULT_SEQUENTIAL_THRESHOLD = 1000;

    /**
     * @brief Per-call generation constraint
     *
     * The exclusion set is borrowed, never owned: it must outlive every
     * generate() call using this constraint.
     */
    struct Constraint {
        std::vector<Digit> prefix;                       // 0..11 fixed leading payload digits
        const IExclusionSet* exclusion = nullptr;        // codes that must not be returned
        std::uint64_t max_attempts = DEFAULT_MAX_ATTEMPTS;
        std::optional<std::chrono::milliseconds> time_budget;
        // Consecutive rejections before switching to a sequential scan (0 = scan at once)
        std::uint64_t sequential_threshold = DEFAULT_SEQUENTIAL_THRESHOLD;

        /**
         * @brief Number of payload digits left free by the prefix
         */
        std::size_t free_digits() const {
            return prefix.size() < PAYLOAD_LENGTH ? PAYLOAD_LENGTH - prefix.size() : 0;
        }

        /**
         * @brief Prefix as a decimal string
         */
        std::string prefix_string() const;

        /**
         * @brief Validate the constraint
         * @throws InvalidDigitError (WBAD_PREFIX) if the prefix has 12+ digits or a digit > 9
         * @throws std::invalid_argument if max_attempts is 0 or the time budget is not positive
         */
        void validate() const;
    };

    /**
     * @brief Parse a decimal prefix string
     * @param prefix e.g. "400638" (empty is allowed)
     * @return std::vector<Digit> The digits
     * @throws InvalidDigitError (WBAD_PREFIX) on a non-digit or 12+ characters
     */
    std::vector<Digit> parse_prefix(const std::string& prefix);

    /**
     * @brief Fluent builder for Constraint
     *
     * Every with_* method returns the builder; build() validates and
     * returns the constraint.
     */
    class ConstraintBuilder {
        private:
            Constraint constraint_;

        public:
            ConstraintBuilder() = default;

            [[nodiscard]] ConstraintBuilder& with_prefix(const std::string& prefix) {
                constraint_.prefix = parse_prefix(prefix);
                return *this;
            }

            [[nodiscard]] ConstraintBuilder& with_prefix(std::vector<Digit> prefix) {
                constraint_.prefix = std::move(prefix);
                return *this;
            }

            [[nodiscard]] ConstraintBuilder& with_exclusion(const IExclusionSet& exclusion) {
                constraint_.exclusion = &exclusion;
                return *this;
            }

            [[nodiscard]] ConstraintBuilder& with_max_attempts(std::uint64_t attempts) {
                constraint_.max_attempts = attempts;
                return *this;
            }

            [[nodiscard]] ConstraintBuilder& with_time_budget(std::chrono::milliseconds budget) {
                constraint_.time_budget = budget;
                return *this;
            }

            [[nodiscard]] ConstraintBuilder& with_sequential_threshold(std::uint64_t threshold) {
                constraint_.sequential_threshold = threshold;
                return *this;
            }

            /**
             * @brief Validate and return the constraint
             * @throws InvalidDigitError / std::invalid_argument, see Constraint::validate()
             */
            [[nodiscard]] Constraint build() const {
                constraint_.validate();
                return constraint_;
            }
    };

    /**
     * @brief Convenience factory for ConstraintBuilder
     */
    inline ConstraintBuilder make_constraint() {
        return ConstraintBuilder();
    }

} // namespace ean13

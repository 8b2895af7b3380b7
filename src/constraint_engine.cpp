/**
 * @file constraint_engine.cpp
 * @brief Constraint validation and constrained generation
 * @version 1.0
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "../include/pattern/constraint_engine.hpp"
#include "../include/interface/codec.hpp"
#include "../include/exception/ean13_exception.hpp"

#include <array>
#include <chrono>
#include <sstream>
#include <stdexcept>

namespace ean13 {

    namespace {

        /**
         * @brief Union of the constraint's exclusion set and a batch store
         */
        class CombinedExclusion : public IExclusionSet {
            public:
                CombinedExclusion(const IExclusionSet* base, const IExclusionSet& store)
                    : base_(base), store_(store) {}

                bool contains(const Ean13Code& code) const override {
                    return store_.contains(code) || (base_ && base_->contains(code));
                }

                std::size_t size() const override {
                    return store_.size() + (base_ ? base_->size() : 0);
                }

            private:
                const IExclusionSet* base_;
                const IExclusionSet& store_;
        };

        std::uint64_t pow10(std::size_t exponent) {
            std::uint64_t value = 1;
            for (std::size_t i = 0; i < exponent; ++i) {
                value *= 10;
            }
            return value;
        }

    } // namespace

    // === Constraint ===

    std::vector<Digit> parse_prefix(const std::string& prefix) {
        if (prefix.size() >= PAYLOAD_LENGTH) {
            throw InvalidDigitError(Status::WBAD_PREFIX,
                "parse_prefix: \"" + prefix + "\" must be shorter than 12 digits");
        }

        std::vector<Digit> digits;
        digits.reserve(prefix.size());
        for (std::size_t i = 0; i < prefix.size(); ++i) {
            const char c = prefix[i];
            if (c < '0' || c > '9') {
                throw InvalidDigitError(Status::WBAD_PREFIX,
                    "parse_prefix: '" + std::string(1, c) + "' at position " + std::to_string(i));
            }
            digits.push_back(static_cast<Digit>(c - '0'));
        }
        return digits;
    }

    std::string Constraint::prefix_string() const {
        std::string out;
        for (Digit d : prefix) {
            out.push_back(static_cast<char>('0' + d));
        }
        return out;
    }

    void Constraint::validate() const {
        if (prefix.size() >= PAYLOAD_LENGTH) {
            throw InvalidDigitError(Status::WBAD_PREFIX,
                "Constraint: prefix of " + std::to_string(prefix.size()) +
                " digits leaves no free digit");
        }
        for (std::size_t i = 0; i < prefix.size(); ++i) {
            if (!is_digit(prefix[i])) {
                throw InvalidDigitError(Status::WBAD_PREFIX,
                    "Constraint: prefix value " + std::to_string(prefix[i]) + " at position " +
                    std::to_string(i));
            }
        }
        if (max_attempts == 0) {
            throw std::invalid_argument("Constraint: max_attempts must be > 0");
        }
        if (time_budget && time_budget->count() <= 0) {
            throw std::invalid_argument("Constraint: time budget must be positive");
        }
    }

    // === GenerationStats ===

    std::string GenerationStats::to_string() const {
        std::ostringstream oss;
        oss << "attempts=" << attempts << " rejections=" << rejections
            << " sequential_scan=" << (sequential_scan ? "yes" : "no")
            << " space_exhausted=" << (space_exhausted ? "yes" : "no");
        return oss.str();
    }

    // === ConstraintEngine ===

    ConstraintEngine::ConstraintEngine() : rng_(std::random_device{}()) {}

    ConstraintEngine::ConstraintEngine(std::uint64_t seed) : rng_(seed) {}

    std::uint64_t ConstraintEngine::free_space(const Constraint& constraint) {
        return pow10(constraint.free_digits());
    }

    std::uint64_t ConstraintEngine::draw(std::uint64_t space) {
        std::uniform_int_distribution<std::uint64_t> dist(0, space - 1);
        return dist(rng_);
    }

    GenerationResult ConstraintEngine::try_generate(const Constraint& constraint) {
        stats_ = GenerationStats{};

        try {
            constraint.validate();
        } catch (const InvalidDigitError& e) {
            return GenerationResult::error(e.status(), e.context());
        } catch (const std::invalid_argument& e) {
            // A zero attempt or time budget can never produce a code
            return GenerationResult::error(Status::GEXHAUSTED, e.what());
        }

        using clock = std::chrono::steady_clock;
        const bool timed = constraint.time_budget.has_value();
        const auto deadline = timed ? clock::now() + *constraint.time_budget : clock::time_point{};

        const std::size_t prefix_len = constraint.prefix.size();
        const std::size_t free_len = constraint.free_digits();
        const std::uint64_t space = free_space(constraint);

        std::array<Digit, PAYLOAD_LENGTH> payload{};
        std::copy(constraint.prefix.begin(), constraint.prefix.end(), payload.begin());

        std::uint64_t consecutive = 0;
        std::uint64_t scan_start = 0;
        std::uint64_t scanned = 0;

        if (constraint.sequential_threshold == 0) {
            stats_.sequential_scan = true;
            scan_start = draw(space);
        }

        while (stats_.attempts < constraint.max_attempts) {
            if (timed && clock::now() >= deadline) {
                return GenerationResult::error(Status::GEXHAUSTED,
                    "try_generate: time budget spent after " + std::to_string(stats_.attempts) +
                    " attempts");
            }

            std::uint64_t suffix;
            if (stats_.sequential_scan) {
                if (scanned == space) {
                    stats_.space_exhausted = true;
                    return GenerationResult::error(Status::GEXHAUSTED,
                        "try_generate: all " + std::to_string(space) + " codes with prefix \"" +
                        constraint.prefix_string() + "\" are excluded");
                }
                suffix = (scan_start + scanned) % space;
                ++scanned;
            } else {
                suffix = draw(space);
            }

            // Spread the suffix over the free positions, most significant first
            for (std::size_t i = free_len; i-- > 0;) {
                payload[prefix_len + i] = static_cast<Digit>(suffix % 10);
                suffix /= 10;
            }

            const Ean13Code candidate = Codec::encode(payload);
            ++stats_.attempts;

            if (!constraint.exclusion || !constraint.exclusion->contains(candidate)) {
                return GenerationResult::success(candidate);
            }

            ++stats_.rejections;
            ++consecutive;
            if (!stats_.sequential_scan && consecutive >= constraint.sequential_threshold) {
                stats_.sequential_scan = true;
                scan_start = draw(space);
                scanned = 0;
            }
        }

        return GenerationResult::error(Status::GEXHAUSTED,
            "try_generate: " + std::to_string(constraint.max_attempts) +
            " attempts without a free code");
    }

    Ean13Code ConstraintEngine::generate(const Constraint& constraint) {
        return try_generate(constraint).value_or_throw("ConstraintEngine::generate");
    }

    std::vector<Ean13Code> ConstraintEngine::generate_batch(const Constraint& constraint,
        std::size_t count, IExclusionStore& store) {
        CombinedExclusion combined(constraint.exclusion, store);
        Constraint per_code = constraint;
        per_code.exclusion = &combined;

        std::vector<Ean13Code> codes;
        codes.reserve(count);
        while (codes.size() < count) {
            Ean13Code code = generate(per_code);
            // Another writer may have claimed it since contains() said no
            if (store.insert(code)) {
                codes.push_back(code);
            }
        }
        return codes;
    }

} // namespace ean13

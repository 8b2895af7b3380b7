/**
 * @file mock_exclusion_set.hpp
 * @brief Mock implementation of IExclusionSet for testing
 * @version 1.0
 * @date 2026-10-19
 *
 * Lets generator tests script which candidates are rejected and count how
 * many times the engine consulted the collaborator.
 */

#pragma once

#include "../../include/io/exclusion_set.hpp"
#include "../../include/code/ean13_code.hpp"
#include <atomic>
#include <functional>
#include <utility>
#include <unordered_set>

namespace ean13 {
    namespace test {

        /**
         * @brief Mock exclusion set
         *
         * Features:
         * - Explicit set of excluded codes
         * - Optional predicate (e.g. "everything except codes ending in 7")
         * - exclude_all() to simulate a fully taken code space
         * - Query counter for verifying the attempt budget
         */
        class MockExclusionSet : public IExclusionSet {
            public:
                using Predicate = std::function<bool(const Ean13Code&)>;

                MockExclusionSet() = default;

                explicit MockExclusionSet(Predicate predicate)
                    : predicate_(std::move(predicate)) {}

                // === IExclusionSet Interface ===

                bool contains(const Ean13Code& code) const override {
                    ++queries_;
                    if (exclude_all_) {
                        return true;
                    }
                    if (codes_.count(code) > 0) {
                        return true;
                    }
                    return predicate_ && predicate_(code);
                }

                std::size_t size() const override {
                    return codes_.size();
                }

                // === Test Helper Methods ===

                void add(const Ean13Code& code) {
                    codes_.insert(code);
                }

                void exclude_all(bool enabled = true) {
                    exclude_all_ = enabled;
                }

                std::size_t query_count() const {
                    return queries_.load();
                }

                void reset_query_count() {
                    queries_ = 0;
                }

            private:
                std::unordered_set<Ean13Code> codes_;
                Predicate predicate_;
                bool exclude_all_ = false;
                mutable std::atomic<std::size_t> queries_{0};
        };

    } // namespace test
} // namespace ean13

/**
 * @file memory_exclusion_set.hpp
 * @brief Thread-safe in-memory exclusion store
 * @version 1.0
 * @date 2026-10-19
 */

#pragma once

#include <initializer_list>
#include <shared_mutex>
#include <unordered_set>
#include <vector>

#include "exclusion_set.hpp"

namespace ean13 {

    /**
     * @brief Hash-set backed exclusion store
     *
     * Readers take a shared lock, insert() takes an exclusive lock, so
     * insert() is the atomic check-and-insert concurrent generators need.
     */
    class MemoryExclusionSet : public IExclusionStore {
        public:
            MemoryExclusionSet() = default;

            MemoryExclusionSet(std::initializer_list<Ean13Code> codes);

            explicit MemoryExclusionSet(const std::vector<Ean13Code>& codes);

            // === IExclusionStore Interface ===

            bool contains(const Ean13Code& code) const override;

            std::size_t size() const override;

            bool insert(const Ean13Code& code) override;

            // === Extras ===

            /**
             * @brief Remove a code, returning true if it was present
             */
            bool erase(const Ean13Code& code);

            void clear();

            /**
             * @brief Copy of the stored codes, sorted
             */
            std::vector<Ean13Code> snapshot() const;

        private:
            mutable std::shared_mutex mutex_;
            std::unordered_set<Ean13Code> codes_;
    };

} // namespace ean13

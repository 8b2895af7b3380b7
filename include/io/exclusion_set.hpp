/**
 * @file exclusion_set.hpp
 * @brief Abstract interfaces for the "existing codes" collaborator
 * @version 1.0
 * @date 2026-10-19
 *
 * The generator only asks whether a code is already taken. Where the taken
 * codes live (memory, a file, a remote store) is the caller's business; this
 * keeps the core storage-agnostic and lets tests inject mocks.
 */

#pragma once

#include <cstddef>

#include "../code/ean13_code.hpp"

namespace ean13 {

    /**
     * @brief Read-only membership test
     *
     * Implementations:
     * - MemoryExclusionSet: hash set guarded by a shared mutex
     * - FileExclusionSet: codes loaded from a text file
     * - MockExclusionSet: scripted answers for testing
     */
    class IExclusionSet {
        public:
            virtual ~IExclusionSet() = default;

            /**
             * @brief Check whether a code is already taken
             * @param code Candidate code
             * @return bool True if the code must not be handed out
             */
            virtual bool contains(const Ean13Code& code) const = 0;

            /**
             * @brief Number of excluded codes
             */
            virtual std::size_t size() const = 0;
    };

    /**
     * @brief Membership test plus atomic check-and-insert
     *
     * Concurrent generators sharing one store must claim codes through
     * insert(): contains() followed by a separate write lets two callers
     * observe the same free code.
     */
    class IExclusionStore : public IExclusionSet {
        public:
            /**
             * @brief Record a code unless it is already present
             * @param code Code to record
             * @return bool True if the code was added, false if already present
             */
            virtual bool insert(const Ean13Code& code) = 0;
    };

} // namespace ean13

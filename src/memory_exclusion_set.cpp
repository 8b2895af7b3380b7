/**
 * @file memory_exclusion_set.cpp
 * @brief In-memory exclusion store implementation
 * @version 1.0
 * @date 2026-10-19
 */

#include "../include/io/memory_exclusion_set.hpp"

#include <algorithm>
#include <mutex>

namespace ean13 {

    MemoryExclusionSet::MemoryExclusionSet(std::initializer_list<Ean13Code> codes)
        : codes_(codes.begin(), codes.end()) {}

    MemoryExclusionSet::MemoryExclusionSet(const std::vector<Ean13Code>& codes)
        : codes_(codes.begin(), codes.end()) {}

    bool MemoryExclusionSet::contains(const Ean13Code& code) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return codes_.count(code) != 0;
    }

    std::size_t MemoryExclusionSet::size() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return codes_.size();
    }

    bool MemoryExclusionSet::insert(const Ean13Code& code) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        return codes_.insert(code).second;
    }

    bool MemoryExclusionSet::erase(const Ean13Code& code) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        return codes_.erase(code) != 0;
    }

    void MemoryExclusionSet::clear() {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        codes_.clear();
    }

    std::vector<Ean13Code> MemoryExclusionSet::snapshot() const {
        std::vector<Ean13Code> out;
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            out.assign(codes_.begin(), codes_.end());
        }
        std::sort(out.begin(), out.end());
        return out;
    }

} // namespace ean13

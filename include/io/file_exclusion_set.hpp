/**
 * @file file_exclusion_set.hpp
 * @brief Exclusion store backed by a plain text file of codes
 * @version 1.0
 * @date 2026-10-19
 *
 * File format: one 13-digit code per line. Blank lines and lines starting
 * with '#' are ignored; surrounding whitespace is trimmed.
 * ```
 * # codes already printed
 * 4006381333931
 * 5901234123457
 * ```
 */

#pragma once

#include <memory>
#include <mutex>
#include <string>

#include "memory_exclusion_set.hpp"

namespace ean13 {

    /**
     * @brief File-backed exclusion store
     *
     * The whole file is loaded at construction. insert() records the code in
     * memory and, when write-back is enabled, appends it to the file so the
     * next run sees it.
     */
    class FileExclusionSet : public IExclusionStore {
        public:
            /**
             * @brief Load the codes of a file
             * @param path Path to the code file
             * @param write_back Append codes accepted through insert() to the file
             * @param create_if_missing Start empty instead of failing when the file is absent
             * @throws StorageError (DNOT_FOUND) if the file is absent and create_if_missing is false
             * @throws StorageError (DREAD_ERROR) if the file cannot be read
             * @throws InvalidDigitError / ChecksumMismatchError for a corrupt line
             *         (context names the file and line number)
             */
            explicit FileExclusionSet(const std::string& path, bool write_back = false,
                bool create_if_missing = false);

            /**
             * @brief Factory method
             * @return std::unique_ptr<FileExclusionSet> Loaded store
             */
            static std::unique_ptr<FileExclusionSet> open(const std::string& path,
                bool write_back = false, bool create_if_missing = false);

            // === IExclusionStore Interface ===

            bool contains(const Ean13Code& code) const override;

            std::size_t size() const override;

            /**
             * @brief Record a code, appending it to the file when write-back is on
             * @throws StorageError (DWRITE_ERROR) if the append fails; the code
             *         is then not recorded in memory either
             */
            bool insert(const Ean13Code& code) override;

            const std::string& path() const { return path_; }

            bool write_back() const { return write_back_; }

        private:
            std::string path_;
            bool write_back_;
            MemoryExclusionSet codes_;
            std::mutex append_mutex_;

            void load(bool create_if_missing);

            void append_line(const Ean13Code& code);
    };

} // namespace ean13

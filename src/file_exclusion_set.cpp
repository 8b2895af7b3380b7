/**
 * @file file_exclusion_set.cpp
 * @brief File-backed exclusion store implementation
 * @version 1.0
 * @date 2026-10-19
 */

#include "../include/io/file_exclusion_set.hpp"
#include "../include/exception/ean13_exception.hpp"

#include <filesystem>
#include <fstream>

namespace ean13 {

    namespace {

        std::string trim(const std::string& line) {
            const auto first = line.find_first_not_of(" \t\r\n");
            if (first == std::string::npos) {
                return "";
            }
            const auto last = line.find_last_not_of(" \t\r\n");
            return line.substr(first, last - first + 1);
        }

        bool file_exists(const std::string& path) {
            std::error_code ec;
            return std::filesystem::exists(path, ec);
        }

    } // namespace

    FileExclusionSet::FileExclusionSet(const std::string& path, bool write_back,
        bool create_if_missing)
        : path_(path), write_back_(write_back) {
        load(create_if_missing);
    }

    std::unique_ptr<FileExclusionSet> FileExclusionSet::open(const std::string& path,
        bool write_back, bool create_if_missing) {
        return std::make_unique<FileExclusionSet>(path, write_back, create_if_missing);
    }

    void FileExclusionSet::load(bool create_if_missing) {
        if (!file_exists(path_)) {
            if (create_if_missing) {
                return;
            }
            throw StorageError(Status::DNOT_FOUND, "FileExclusionSet: " + path_);
        }

        std::ifstream file(path_);
        if (!file.is_open()) {
            throw StorageError(Status::DREAD_ERROR, "FileExclusionSet: cannot open " + path_);
        }

        std::string line;
        std::size_t line_number = 0;
        while (std::getline(file, line)) {
            ++line_number;
            const std::string entry = trim(line);
            if (entry.empty() || entry[0] == '#') {
                continue;
            }

            try {
                codes_.insert(Ean13Code::from_string(entry));
            } catch (const Ean13Exception& e) {
                // Re-raise with the file position so the bad line can be found
                throw_error(e.status(), path_ + ":" + std::to_string(line_number) + ": " +
                    e.context());
            }
        }

        if (file.bad()) {
            throw StorageError(Status::DREAD_ERROR, "FileExclusionSet: read failed on " + path_);
        }
    }

    bool FileExclusionSet::contains(const Ean13Code& code) const {
        return codes_.contains(code);
    }

    std::size_t FileExclusionSet::size() const {
        return codes_.size();
    }

    bool FileExclusionSet::insert(const Ean13Code& code) {
        if (!write_back_) {
            return codes_.insert(code);
        }

        // Serialize appends so the memory set and the file agree on order
        std::lock_guard<std::mutex> lock(append_mutex_);
        if (codes_.contains(code)) {
            return false;
        }
        append_line(code);
        return codes_.insert(code);
    }

    void FileExclusionSet::append_line(const Ean13Code& code) {
        std::ofstream file(path_, std::ios::app);
        if (!file.is_open()) {
            throw StorageError(Status::DWRITE_ERROR, "FileExclusionSet: cannot open " + path_);
        }
        file << code.to_string() << '\n';
        file.flush();
        if (!file) {
            throw StorageError(Status::DWRITE_ERROR, "FileExclusionSet: write failed on " + path_);
        }
    }

} // namespace ean13

/**
 * @file test_utils.hpp
 * @brief Test utility functions shared by the ean13 tests
 * @version 1.0
 * @date 2026-10-19
 */

#pragma once

#include "../include/ean13.hpp"
#include <cstdio>
#include <fstream>
#include <string>
#include <vector>
#include <unistd.h>

namespace ean13 {
    namespace test {

        /**
         * @brief Convert a decimal string to digit values, without validation
         */
        inline std::vector<Digit> digits_of(const std::string& text) {
            std::vector<Digit> digits;
            for (char c : text) {
                digits.push_back(static_cast<Digit>(c - '0'));
            }
            return digits;
        }

        /**
         * @brief Temporary file removed on destruction
         *
         * Example:
         * @code
         * TempFile file({"4006381333931", "# comment"});
         * FileExclusionSet set(file.path());
         * @endcode
         */
        class TempFile {
            public:
                TempFile() : path_(make_path()) {}

                explicit TempFile(const std::vector<std::string>& lines) : path_(make_path()) {
                    write(lines);
                }

                ~TempFile() {
                    std::remove(path_.c_str());
                }

                TempFile(const TempFile&) = delete;
                TempFile& operator=(const TempFile&) = delete;

                const std::string& path() const { return path_; }

                void write(const std::vector<std::string>& lines) const {
                    std::ofstream out(path_, std::ios::trunc);
                    for (const auto& line : lines) {
                        out << line << '\n';
                    }
                }

                std::vector<std::string> read_lines() const {
                    std::vector<std::string> lines;
                    std::ifstream in(path_);
                    std::string line;
                    while (std::getline(in, line)) {
                        lines.push_back(line);
                    }
                    return lines;
                }

            private:
                std::string path_;

                static std::string make_path() {
                    static int counter = 0;
                    return "/tmp/ean13_test_" + std::to_string(::getpid()) + "_" +
                        std::to_string(counter++) + ".txt";
                }
        };

    } // namespace test
} // namespace ean13

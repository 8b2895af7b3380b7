/**
 * @file module_pattern.hpp
 * @brief Bar/space module sequence and the symbol metadata renderers consume
 * @version 1.0
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 */

#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>
#include <boost/core/span.hpp>

#include "../enums/symbology.hpp"
#include "ean13_code.hpp"

namespace ean13 {

    /**
     * @brief Ordered sequence of bar/space modules
     *
     * A pattern produced by Codec::to_module_pattern() is always 95 modules
     * long. Any length can be held so that scanned or typed input can be
     * represented and then rejected by Codec::decode().
     */
    class ModulePattern {
        public:
            ModulePattern() = default;

            explicit ModulePattern(std::vector<Module> modules) : modules_(std::move(modules)) {}

            /**
             * @brief Parse the text form, '1' for a bar and '0' for a space
             * @param text Module string, e.g. "10100011010..."
             * @return ModulePattern Parsed pattern (length is not checked here)
             * @throws MalformedPatternError on any other character
             */
            static ModulePattern from_string(const std::string& text);

            /**
             * @brief Text form, '1' for a bar and '0' for a space
             */
            std::string to_string() const;

            std::size_t size() const { return modules_.size(); }
            bool empty() const { return modules_.empty(); }

            Module operator[](std::size_t index) const { return modules_[index]; }

            span<const Module> modules() const {
                return span<const Module>(modules_.data(), modules_.size());
            }

            /**
             * @brief Append the low `width` bits of `bits`, most significant first
             */
            void append_bits(std::uint8_t bits, std::size_t width);

            /**
             * @brief Read `width` modules starting at `offset` as a bit mask
             * @note Caller guarantees offset + width <= size()
             */
            std::uint8_t read_bits(std::size_t offset, std::size_t width) const;

            bool operator==(const ModulePattern& other) const { return modules_ == other.modules_; }
            bool operator!=(const ModulePattern& other) const { return modules_ != other.modules_; }

        private:
            std::vector<Module> modules_;
    };

    /**
     * @brief Position of a guard inside the pattern
     */
    struct GuardSpan {
        GuardKind kind;
        std::size_t offset;
        std::size_t width;
    };

    /**
     * @brief Position of an encoded digit inside the pattern
     */
    struct DigitSpan {
        std::size_t digit_index;    // 1..12, index into the 13 code digits
        std::size_t offset;
        CodeSet set;
    };

    /**
     * @brief Everything a renderer needs to draw one EAN13 symbol
     *
     * The first code digit has no DigitSpan: it is carried by the L/G parity
     * of the left group and is only printed as text, left of the start guard.
     */
    struct Symbol {
        Ean13Code code;
        ModulePattern pattern;
        std::array<GuardSpan, 3> guards;
        std::array<DigitSpan, PAYLOAD_LENGTH> digits;
        std::size_t quiet_zone_left = QUIET_ZONE_LEFT;
        std::size_t quiet_zone_right = QUIET_ZONE_RIGHT;

        /**
         * @brief True if the module at `index` belongs to a guard
         */
        bool is_guard_module(std::size_t index) const;

        /**
         * @brief Human-readable digit string, e.g. "4 006381 333931"
         */
        std::string text() const { return code.to_display_string(); }

        /**
         * @brief Total width in modules, quiet zones included
         */
        std::size_t total_width() const {
            return quiet_zone_left + pattern.size() + quiet_zone_right;
        }
    };

} // namespace ean13

/**
 * @file symbology.hpp
 * @brief EAN13 structural constants and enum definitions.
 * @version 1.0
 * @date 2026-10-19
 *
 * Symbol structure (95 modules):
 * ```
 * [START 101][LEFT 6x7][CENTER 01010][RIGHT 6x7][END 101]
 *   0-2        3-44       45-49        50-91      92-94
 * ```
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <boost/core/span.hpp>

namespace ean13 {

    using boost::span;

    /// A decimal digit, always in [0,9] once validated
    using Digit = std::uint8_t;

    // === Structural Constants ===

    static constexpr std::size_t PAYLOAD_LENGTH = 12;
    static constexpr std::size_t CODE_LENGTH = 13;
    static constexpr std::size_t GROUP_DIGITS = 6;      // digits per half
    static constexpr std::size_t MODULES_PER_DIGIT = 7;
    static constexpr std::size_t EDGE_GUARD_MODULES = 3;
    static constexpr std::size_t CENTER_GUARD_MODULES = 5;
    static constexpr std::size_t TOTAL_MODULES =
        2 * EDGE_GUARD_MODULES + CENTER_GUARD_MODULES + 2 * GROUP_DIGITS * MODULES_PER_DIGIT;

    // Recommended quiet zones, in modules
    static constexpr std::size_t QUIET_ZONE_LEFT = 11;
    static constexpr std::size_t QUIET_ZONE_RIGHT = 7;

    static_assert(TOTAL_MODULES == 95, "EAN13 symbols are 95 modules wide");

    /**
     * @brief Module offsets inside a 95-module symbol.
     */
    struct Layout {
        static constexpr std::size_t START_GUARD = 0;
        static constexpr std::size_t LEFT_GROUP = START_GUARD + EDGE_GUARD_MODULES;                     // 3
        static constexpr std::size_t CENTER_GUARD = LEFT_GROUP + GROUP_DIGITS * MODULES_PER_DIGIT;      // 45
        static constexpr std::size_t RIGHT_GROUP = CENTER_GUARD + CENTER_GUARD_MODULES;                 // 50
        static constexpr std::size_t END_GUARD = RIGHT_GROUP + GROUP_DIGITS * MODULES_PER_DIGIT;        // 92
    };

    /**
     * @brief A single bar/space unit of the printed symbol.
     */
    enum class Module : std::uint8_t {
        SPACE = 0,
        BAR = 1
    };

    /**
     * @brief The three families of 7-module digit encodings.
     * @note Available code sets are:
     * - L: left half, odd parity
     *
     * - G: left half, even parity
     *
     * - R: right half
     */
    enum class CodeSet : std::uint8_t {
        L = 0,
        G = 1,
        R = 2
    };

    /**
     * @brief Fixed markers framing the digit groups.
     */
    enum class GuardKind : std::uint8_t {
        START = 0,
        CENTER = 1,
        END = 2
    };

    // Guard bit masks, most significant bit is the leftmost module
    static constexpr std::uint8_t EDGE_GUARD = 0b101;
    static constexpr std::uint8_t CENTER_GUARD = 0b01010;

    // === Enum Helper Functions ===

    inline constexpr bool is_digit(int value) {
        return value >= 0 && value <= 9;
    }

    inline constexpr Module module_from_bit(bool bar) {
        return bar ? Module::BAR : Module::SPACE;
    }

    inline constexpr char to_char(Module m) {
        return m == Module::BAR ? '1' : '0';
    }

    inline constexpr char to_char(CodeSet set) {
        switch (set) {
        case CodeSet::L:
            return 'L';
        case CodeSet::G:
            return 'G';
        default:
            return 'R';
        }
    }

    inline std::string to_string(GuardKind kind) {
        switch (kind) {
        case GuardKind::START:
            return "start";
        case GuardKind::CENTER:
            return "center";
        default:
            return "end";
        }
    }

} // namespace ean13

/**
 * @file encoding_tables.hpp
 * @brief EAN13 digit encoding tables and the first-digit parity table
 * @version 1.0
 * @date 2026-10-19
 *
 * Each digit encoding is a 7-module element stored as a 7-bit mask, the most
 * significant of the 7 bits being the leftmost module (1 = bar).
 *
 * - L codes start with a space and have an odd number of bar modules.
 * - R codes are the bitwise complement of L codes.
 * - G codes are the R codes read right to left.
 *
 * @copyright Copyright (c) 2026
 */

#pragma once

#include <array>
#include <cstdint>
#include <optional>

#include "../enums/symbology.hpp"

namespace ean13 {

    /**
     * @brief Pure static holder for the encoding tables
     *
     * No state. Lookups in both directions; the reverse lookup reports
     * ambiguity instead of picking a table.
     */
    class EncodingTables {
        public:
            using ElementTable = std::array<std::uint8_t, 10>;

            static constexpr std::uint8_t ELEMENT_MASK = 0x7F;

            static constexpr ElementTable L_CODES = {
                0b0001101, 0b0011001, 0b0010011, 0b0111101, 0b0100011,
                0b0110001, 0b0101111, 0b0111011, 0b0110111, 0b0001011
            };

            static constexpr ElementTable G_CODES = {
                0b0100111, 0b0110011, 0b0011011, 0b0100001, 0b0011101,
                0b0111001, 0b0000101, 0b0010001, 0b0001001, 0b0010111
            };

            static constexpr ElementTable R_CODES = {
                0b1110010, 0b1100110, 0b1101100, 0b1000010, 0b1011100,
                0b1001110, 0b1010000, 0b1000100, 0b1001000, 0b1110100
            };

            /**
             * @brief Parity rows, indexed by the first payload digit.
             *
             * Bit 5 (MSB) is the first left-group digit; a set bit selects G.
             * ```
             * 0 LLLLLL  1 LLGLGG  2 LLGGLG  3 LLGGGL  4 LGLLGG
             * 5 LGGLLG  6 LGGGLL  7 LGLGLG  8 LGLGGL  9 LGGLGL
             * ```
             */
            static constexpr std::array<std::uint8_t, 10> PARITY = {
                0b000000, 0b001011, 0b001101, 0b001110, 0b010011,
                0b011001, 0b011100, 0b010101, 0b010110, 0b011010
            };

            /**
             * @brief Element for a digit in a code set
             * @param set L, G or R
             * @param digit Digit in [0,9] (caller-validated)
             * @return std::uint8_t 7-bit element mask
             */
            static constexpr std::uint8_t element(CodeSet set, Digit digit) {
                switch (set) {
                case CodeSet::L:
                    return L_CODES[digit];
                case CodeSet::G:
                    return G_CODES[digit];
                default:
                    return R_CODES[digit];
                }
            }

            /**
             * @brief Code set used for a left-group position
             * @param first_digit Leading payload digit
             * @param position Left-group position in [0,5]
             * @return CodeSet L or G
             */
            static constexpr CodeSet left_set(Digit first_digit, std::size_t position) {
                const std::uint8_t row = PARITY[first_digit];
                return ((row >> (GROUP_DIGITS - 1 - position)) & 0x01) ? CodeSet::G : CodeSet::L;
            }

            /**
             * @brief Result of a reverse element lookup
             */
            struct Match {
                Digit digit;
                CodeSet set;
            };

            /**
             * @brief Find the digit an element encodes among the allowed code sets
             *
             * @param element 7-bit mask read from the pattern
             * @param left_half True to search L and G, false to search R only
             * @param ambiguous Set to true when more than one entry matched
             * @return std::optional<Match> The single match, or nullopt when
             *         nothing or more than one entry matched
             */
            static std::optional<Match> lookup(std::uint8_t element, bool left_half,
                bool& ambiguous) {
                ambiguous = false;
                std::optional<Match> found;
                std::size_t hits = 0;

                auto scan = [&](const ElementTable& table, CodeSet set) {
                        for (std::size_t d = 0; d < table.size(); ++d) {
                            if (table[d] == element) {
                                found = Match{static_cast<Digit>(d), set};
                                ++hits;
                            }
                        }
                    };

                if (left_half) {
                    scan(L_CODES, CodeSet::L);
                    scan(G_CODES, CodeSet::G);
                } else {
                    scan(R_CODES, CodeSet::R);
                }

                if (hits > 1) {
                    ambiguous = true;
                    return std::nullopt;
                }
                return found;
            }

            /**
             * @brief First payload digit whose parity row equals an L/G sequence
             * @param row 6-bit L/G selector read from the left group
             * @return std::optional<Digit> The digit, or nullopt if no row matches
             */
            static std::optional<Digit> first_digit_for(std::uint8_t row) {
                for (std::size_t d = 0; d < PARITY.size(); ++d) {
                    if (PARITY[d] == row) {
                        return static_cast<Digit>(d);
                    }
                }
                return std::nullopt;
            }

            /**
             * @brief True when no element appears twice across the three tables
             */
            static constexpr bool tables_disjoint() {
                const ElementTable* tables[] = {&L_CODES, &G_CODES, &R_CODES};
                for (std::size_t a = 0; a < 30; ++a) {
                    for (std::size_t b = a + 1; b < 30; ++b) {
                        if ((*tables[a / 10])[a % 10] == (*tables[b / 10])[b % 10]) {
                            return false;
                        }
                    }
                }
                return true;
            }

            /**
             * @brief True when every first digit has its own parity row
             */
            static constexpr bool parity_rows_unique() {
                for (std::size_t a = 0; a < PARITY.size(); ++a) {
                    for (std::size_t b = a + 1; b < PARITY.size(); ++b) {
                        if (PARITY[a] == PARITY[b]) {
                            return false;
                        }
                    }
                }
                return true;
            }

            /**
             * @brief True when R = ~L and G = reverse(R) for every digit
             */
            static constexpr bool tables_consistent() {
                for (std::size_t d = 0; d < 10; ++d) {
                    if (R_CODES[d] != (~L_CODES[d] & ELEMENT_MASK)) {
                        return false;
                    }
                    std::uint8_t reversed = 0;
                    for (std::size_t bit = 0; bit < MODULES_PER_DIGIT; ++bit) {
                        reversed = static_cast<std::uint8_t>(
                            (reversed << 1) | ((R_CODES[d] >> bit) & 0x01));
                    }
                    if (G_CODES[d] != reversed) {
                        return false;
                    }
                }
                return true;
            }
    };

    static_assert(EncodingTables::tables_disjoint(),
        "L, G and R element tables must not share an element");
    static_assert(EncodingTables::parity_rows_unique(),
        "Each first digit needs a distinct parity row");
    static_assert(EncodingTables::tables_consistent(),
        "R must complement L and G must mirror R");

} // namespace ean13

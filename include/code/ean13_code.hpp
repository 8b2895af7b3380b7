/**
 * @file ean13_code.hpp
 * @brief Immutable 13-digit EAN13 code value
 * @version 1.0
 * @date 2026-10-19
 *
 * Code structure:
 * ```
 * [D0][D1 ... D6][D7 ... D12]
 *   |   left grp   right grp (D12 = check digit)
 *   +-- first digit, selects the left-group parity row
 * ```
 *
 * @copyright Copyright (c) 2026
 */

#pragma once

#include <array>
#include <cstddef>
#include <functional>
#include <string>
#include <boost/core/span.hpp>

#include "../enums/symbology.hpp"

namespace ean13 {

    class Codec;

    /**
     * @brief A validated EAN13 code: 12 payload digits plus the check digit
     *
     * Instances only exist in a valid state: the 13th digit always equals the
     * checksum of the first 12. Built by Codec::encode() or by the validating
     * parsers below; there is no mutating API.
     */
    class Ean13Code {
        public:
            using Digits = std::array<Digit, CODE_LENGTH>;

            // === Validating Parsers ===

            /**
             * @brief Parse 13 digits
             * @param digits Exactly 13 digits, the last being the check digit
             * @return Ean13Code The validated code
             * @throws InvalidDigitError on wrong length or a digit > 9
             * @throws ChecksumMismatchError if the check digit is wrong
             */
            static Ean13Code from_digits(span<const Digit> digits);

            /**
             * @brief Parse a 13-character decimal string
             * @param text e.g. "4006381333931"
             * @return Ean13Code The validated code
             * @throws InvalidDigitError on wrong length or a non-digit character
             * @throws ChecksumMismatchError if the check digit is wrong
             */
            static Ean13Code from_string(const std::string& text);

            // === Accessors ===

            const Digits& digits() const { return digits_; }

            Digit operator[](std::size_t index) const { return digits_[index]; }

            /**
             * @brief The 12 payload digits (without the check digit)
             */
            span<const Digit> payload() const {
                return span<const Digit>(digits_.data(), PAYLOAD_LENGTH);
            }

            Digit check_digit() const { return digits_[PAYLOAD_LENGTH]; }

            Digit first_digit() const { return digits_[0]; }

            /**
             * @brief Plain 13-character representation, e.g. "4006381333931"
             */
            std::string to_string() const;

            /**
             * @brief Printed form: first digit, left group and right group
             * separated by spaces, e.g. "4 006381 333931"
             */
            std::string to_display_string() const;

            // === Comparison ===

            bool operator==(const Ean13Code& other) const { return digits_ == other.digits_; }
            bool operator!=(const Ean13Code& other) const { return digits_ != other.digits_; }
            bool operator<(const Ean13Code& other) const { return digits_ < other.digits_; }

            /**
             * @brief Numeric value of the 13 digits (fits in 64 bits)
             */
            std::uint64_t to_integer() const;

        private:
            friend class Codec;

            Digits digits_;

            explicit Ean13Code(const Digits& digits) : digits_(digits) {}
    };

} // namespace ean13

namespace std {
    template<> struct hash<ean13::Ean13Code> {
        std::size_t operator()(const ean13::Ean13Code& code) const noexcept {
            return std::hash<std::uint64_t>{}(code.to_integer());
        }
    };
} // namespace std

/**
 * @file checksum.hpp
 * @brief Pure static helper for the EAN13 check digit
 * @version 1.0
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <boost/core/span.hpp>

#include "../enums/symbology.hpp"

namespace ean13 {

    /**
     * @brief Static helper for check digit computation and validation
     *
     * Pure static class with no state, safe to call from any thread.
     */
    class Checksum {
        public:
            /**
             * @brief Compute the check digit of a 12-digit payload
             *
             * Digits at even 0-based indices weigh 1, digits at odd indices
             * weigh 3 (weight 3 falls on the odd positions counted from the
             * right of the payload). The check digit brings the weighted sum
             * up to the next multiple of 10.
             *
             * @param payload Exactly 12 digits
             * @return Digit The check digit in [0,9]
             * @throws InvalidDigitError if the length is not 12 or a digit is > 9
             *
             * @example
             * @code
             * std::array<Digit, 12> p = {4, 0, 0, 6, 3, 8, 1, 0, 1, 2, 9, 3};
             * auto check = Checksum::compute(p);  // 5
             * @endcode
             */
            static Digit compute(span<const Digit> payload);

            /**
             * @brief Check that the 13th digit matches the first 12
             * @param code Exactly 13 digits
             * @return bool True if the stored check digit is the computed one
             * @throws InvalidDigitError if the length is not 13 or a digit is > 9
             */
            static bool verify(span<const Digit> code);

        private:
            static void require_digits(span<const Digit> digits, std::size_t expected,
                const char* op);

            static Digit compute_unchecked(span<const Digit> payload);
    };

} // namespace ean13

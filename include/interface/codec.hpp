/**
 * @file codec.hpp
 * @brief EAN13 encoder/decoder between digits and module patterns
 * @version 1.0
 * @date 2026-10-19
 *
 * Stateless: every method is static, pure and reentrant.
 *
 * @copyright Copyright (c) 2026
 */

#pragma once

#include <string>
#include <boost/core/span.hpp>

#include "../code/ean13_code.hpp"
#include "../code/module_pattern.hpp"
#include "../template/result.hpp"
#include "encoding_tables.hpp"

namespace ean13 {

    /**
     * @brief Static EAN13 codec
     *
     * Example Usage:
     * @code
     * auto code = Codec::encode("400638133393");      // 4006381333931
     * auto pattern = Codec::to_module_pattern(code);  // 95 modules
     * auto back = Codec::decode(pattern);             // == code
     * @endcode
     */
    class Codec {
        public:
            // === Encoding ===

            /**
             * @brief Append the check digit to a 12-digit payload
             * @param payload Exactly 12 digits
             * @return Ean13Code The complete code
             * @throws InvalidDigitError on wrong length or a digit > 9
             */
            static Ean13Code encode(span<const Digit> payload);

            /**
             * @brief Append the check digit to a 12-character decimal payload
             * @param payload e.g. "400638133393"
             * @return Ean13Code The complete code
             * @throws InvalidDigitError on wrong length or a non-digit character
             */
            static Ean13Code encode(const std::string& payload);

            /**
             * @brief Build the 95-module pattern of a code
             *
             * start guard + 6 left elements (L or G per the parity row of the
             * first digit) + center guard + 6 R elements + end guard.
             *
             * @param code A valid code
             * @return ModulePattern The module sequence
             */
            static ModulePattern to_module_pattern(const Ean13Code& code);

            /**
             * @brief Build the pattern together with the layout metadata renderers need
             * @param code A valid code
             * @return Symbol Pattern, guard and digit spans, quiet zones, text
             */
            static Symbol to_symbol(const Ean13Code& code);

            // === Decoding ===

            /**
             * @brief Decode a module pattern back into a code
             * @param pattern Module sequence, expected 95 modules
             * @return Ean13Code The decoded code
             * @throws MalformedPatternError on bad length, guard, element or parity
             * @throws ChecksumMismatchError if the decoded digits fail verification
             */
            static Ean13Code decode(const ModulePattern& pattern);

            /**
             * @brief Decode a module pattern, reporting failures as a Result
             * @param pattern Module sequence, expected 95 modules
             * @return Result<Ean13Code> The code, or the failing Status with context
             */
            static Result<Ean13Code> try_decode(const ModulePattern& pattern);

        private:
            static Result<void> check_guards(const ModulePattern& pattern);

            static Ean13Code::Digits payload_from_string(const std::string& payload);
    };

} // namespace ean13

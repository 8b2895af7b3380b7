/**
 * @file ean13_code.cpp
 * @brief Ean13Code parsing and formatting
 * @version 1.0
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "../include/code/ean13_code.hpp"
#include "../include/interface/checksum.hpp"
#include "../include/exception/ean13_exception.hpp"

#include <algorithm>

namespace ean13 {

    // === Validating Parsers ===

    Ean13Code Ean13Code::from_digits(span<const Digit> digits) {
        // Length and range checks raise InvalidDigitError
        if (!Checksum::verify(digits)) {
            throw ChecksumMismatchError(Status::WBAD_CHECKSUM,
                "Ean13Code::from_digits: check digit " +
                std::to_string(digits[PAYLOAD_LENGTH]) + " expected " +
                std::to_string(Checksum::compute(digits.first(PAYLOAD_LENGTH))));
        }

        Digits stored{};
        std::copy(digits.begin(), digits.end(), stored.begin());
        return Ean13Code(stored);
    }

    Ean13Code Ean13Code::from_string(const std::string& text) {
        if (text.size() != CODE_LENGTH) {
            throw InvalidDigitError(Status::WBAD_LENGTH,
                "Ean13Code::from_string: expected 13 digits, got \"" + text + "\"");
        }

        Digits parsed{};
        for (std::size_t i = 0; i < CODE_LENGTH; ++i) {
            const char c = text[i];
            if (c < '0' || c > '9') {
                throw InvalidDigitError(Status::WBAD_DIGIT,
                    "Ean13Code::from_string: '" + std::string(1, c) + "' at position " +
                    std::to_string(i));
            }
            parsed[i] = static_cast<Digit>(c - '0');
        }

        return from_digits(parsed);
    }

    // === Formatting ===

    std::string Ean13Code::to_string() const {
        std::string out;
        out.reserve(CODE_LENGTH);
        for (Digit d : digits_) {
            out.push_back(static_cast<char>('0' + d));
        }
        return out;
    }

    std::string Ean13Code::to_display_string() const {
        const std::string plain = to_string();
        return plain.substr(0, 1) + " " + plain.substr(1, GROUP_DIGITS) + " " +
               plain.substr(1 + GROUP_DIGITS);
    }

    std::uint64_t Ean13Code::to_integer() const {
        std::uint64_t value = 0;
        for (Digit d : digits_) {
            value = value * 10 + d;
        }
        return value;
    }

} // namespace ean13

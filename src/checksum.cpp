/**
 * @file checksum.cpp
 * @brief EAN13 check digit implementation
 * @version 1.0
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "../include/interface/checksum.hpp"
#include "../include/exception/ean13_exception.hpp"

#include <string>

namespace ean13 {

    void Checksum::require_digits(span<const Digit> digits, std::size_t expected,
        const char* op) {
        if (digits.size() != expected) {
            throw InvalidDigitError(Status::WBAD_LENGTH,
                std::string(op) + ": expected " + std::to_string(expected) + " digits, got " +
                std::to_string(digits.size()));
        }
        for (std::size_t i = 0; i < digits.size(); ++i) {
            if (!is_digit(digits[i])) {
                throw InvalidDigitError(Status::WBAD_DIGIT,
                    std::string(op) + ": value " + std::to_string(digits[i]) +
                    " at position " + std::to_string(i));
            }
        }
    }

    Digit Checksum::compute_unchecked(span<const Digit> payload) {
        unsigned sum = 0;
        for (std::size_t i = 0; i < PAYLOAD_LENGTH; ++i) {
            sum += payload[i] * ((i % 2 == 0) ? 1u : 3u);
        }
        return static_cast<Digit>((10 - sum % 10) % 10);
    }

    Digit Checksum::compute(span<const Digit> payload) {
        require_digits(payload, PAYLOAD_LENGTH, "Checksum::compute");
        return compute_unchecked(payload);
    }

    bool Checksum::verify(span<const Digit> code) {
        require_digits(code, CODE_LENGTH, "Checksum::verify");
        return compute_unchecked(code.first(PAYLOAD_LENGTH)) == code[PAYLOAD_LENGTH];
    }

} // namespace ean13

/**
 * @file codec.cpp
 * @brief EAN13 codec implementation
 * @version 1.0
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "../include/interface/codec.hpp"
#include "../include/interface/checksum.hpp"
#include "../include/exception/ean13_exception.hpp"

#include <algorithm>

namespace ean13 {

    // === Encoding ===

    Ean13Code Codec::encode(span<const Digit> payload) {
        // Length and range checks raise InvalidDigitError
        const Digit check = Checksum::compute(payload);

        Ean13Code::Digits digits{};
        std::copy(payload.begin(), payload.end(), digits.begin());
        digits[PAYLOAD_LENGTH] = check;
        return Ean13Code(digits);
    }

    Ean13Code Codec::encode(const std::string& payload) {
        const auto digits = payload_from_string(payload);
        return encode(span<const Digit>(digits.data(), PAYLOAD_LENGTH));
    }

    Ean13Code::Digits Codec::payload_from_string(const std::string& payload) {
        if (payload.size() != PAYLOAD_LENGTH) {
            throw InvalidDigitError(Status::WBAD_LENGTH,
                "Codec::encode: expected 12 digits, got \"" + payload + "\"");
        }

        Ean13Code::Digits digits{};
        for (std::size_t i = 0; i < PAYLOAD_LENGTH; ++i) {
            const char c = payload[i];
            if (c < '0' || c > '9') {
                throw InvalidDigitError(Status::WBAD_DIGIT,
                    "Codec::encode: '" + std::string(1, c) + "' at position " +
                    std::to_string(i));
            }
            digits[i] = static_cast<Digit>(c - '0');
        }
        return digits;
    }

    ModulePattern Codec::to_module_pattern(const Ean13Code& code) {
        ModulePattern pattern;
        const Digit first = code.first_digit();

        pattern.append_bits(EDGE_GUARD, EDGE_GUARD_MODULES);
        for (std::size_t pos = 0; pos < GROUP_DIGITS; ++pos) {
            const CodeSet set = EncodingTables::left_set(first, pos);
            pattern.append_bits(EncodingTables::element(set, code[1 + pos]), MODULES_PER_DIGIT);
        }
        pattern.append_bits(CENTER_GUARD, CENTER_GUARD_MODULES);
        for (std::size_t pos = 0; pos < GROUP_DIGITS; ++pos) {
            pattern.append_bits(EncodingTables::element(CodeSet::R, code[1 + GROUP_DIGITS + pos]),
                MODULES_PER_DIGIT);
        }
        pattern.append_bits(EDGE_GUARD, EDGE_GUARD_MODULES);

        return pattern;
    }

    Symbol Codec::to_symbol(const Ean13Code& code) {
        std::array<GuardSpan, 3> guards = {{
            {GuardKind::START, Layout::START_GUARD, EDGE_GUARD_MODULES},
            {GuardKind::CENTER, Layout::CENTER_GUARD, CENTER_GUARD_MODULES},
            {GuardKind::END, Layout::END_GUARD, EDGE_GUARD_MODULES}
        }};

        std::array<DigitSpan, PAYLOAD_LENGTH> digits{};
        for (std::size_t pos = 0; pos < GROUP_DIGITS; ++pos) {
            digits[pos] = DigitSpan{1 + pos, Layout::LEFT_GROUP + pos * MODULES_PER_DIGIT,
                                    EncodingTables::left_set(code.first_digit(), pos)};
            digits[GROUP_DIGITS + pos] = DigitSpan{1 + GROUP_DIGITS + pos,
                                                   Layout::RIGHT_GROUP + pos * MODULES_PER_DIGIT,
                                                   CodeSet::R};
        }

        return Symbol{code, to_module_pattern(code), guards, digits,
                      QUIET_ZONE_LEFT, QUIET_ZONE_RIGHT};
    }

    // === Decoding ===

    Result<void> Codec::check_guards(const ModulePattern& pattern) {
        if (pattern.read_bits(Layout::START_GUARD, EDGE_GUARD_MODULES) != EDGE_GUARD) {
            return Result<void>::error(Status::WBAD_GUARD, "check_guards: start");
        }
        if (pattern.read_bits(Layout::CENTER_GUARD, CENTER_GUARD_MODULES) != CENTER_GUARD) {
            return Result<void>::error(Status::WBAD_GUARD, "check_guards: center");
        }
        if (pattern.read_bits(Layout::END_GUARD, EDGE_GUARD_MODULES) != EDGE_GUARD) {
            return Result<void>::error(Status::WBAD_GUARD, "check_guards: end");
        }
        return Result<void>::success();
    }

    Result<Ean13Code> Codec::try_decode(const ModulePattern& pattern) {
        if (pattern.size() != TOTAL_MODULES) {
            return Result<Ean13Code>::error(Status::WBAD_PATTERN_LENGTH,
                "try_decode: " + std::to_string(pattern.size()) + " modules, expected " +
                std::to_string(TOTAL_MODULES));
        }

        auto guards = check_guards(pattern);
        if (!guards) {
            return Result<Ean13Code>::error(guards, "try_decode");
        }

        Ean13Code::Digits digits{};
        std::uint8_t parity_row = 0;
        bool ambiguous = false;

        // Left group: L or G elements, their sequence gives the first digit
        for (std::size_t pos = 0; pos < GROUP_DIGITS; ++pos) {
            const auto element = pattern.read_bits(Layout::LEFT_GROUP + pos * MODULES_PER_DIGIT,
                MODULES_PER_DIGIT);
            const auto match = EncodingTables::lookup(element, true, ambiguous);
            if (!match) {
                return Result<Ean13Code>::error(Status::WBAD_ELEMENT,
                    std::string("try_decode: ") + (ambiguous ? "ambiguous" : "unknown") +
                    " element at left position " + std::to_string(pos));
            }
            digits[1 + pos] = match->digit;
            parity_row = static_cast<std::uint8_t>((parity_row << 1) |
                (match->set == CodeSet::G ? 1 : 0));
        }

        const auto first = EncodingTables::first_digit_for(parity_row);
        if (!first) {
            return Result<Ean13Code>::error(Status::WBAD_PARITY,
                "try_decode: left group parity matches no first digit");
        }
        digits[0] = *first;

        // Right group: R elements only
        for (std::size_t pos = 0; pos < GROUP_DIGITS; ++pos) {
            const auto element = pattern.read_bits(Layout::RIGHT_GROUP + pos * MODULES_PER_DIGIT,
                MODULES_PER_DIGIT);
            const auto match = EncodingTables::lookup(element, false, ambiguous);
            if (!match) {
                return Result<Ean13Code>::error(Status::WBAD_ELEMENT,
                    std::string("try_decode: ") + (ambiguous ? "ambiguous" : "unknown") +
                    " element at right position " + std::to_string(pos));
            }
            digits[1 + GROUP_DIGITS + pos] = match->digit;
        }

        if (!Checksum::verify(digits)) {
            return Result<Ean13Code>::error(Status::WBAD_CHECKSUM,
                "try_decode: decoded check digit " + std::to_string(digits[PAYLOAD_LENGTH]));
        }

        return Result<Ean13Code>::success(Ean13Code(digits));
    }

    Ean13Code Codec::decode(const ModulePattern& pattern) {
        return try_decode(pattern).value_or_throw("Codec::decode");
    }

} // namespace ean13

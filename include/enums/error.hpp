/**
 * @file error.hpp
 * @brief Status codes for the EAN13 codec and generator.
 * @version 1.0
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 */

#pragma once
#include <string>
#include <system_error>
#include <type_traits>

namespace ean13 {

/**
 * @enum Status
 * @brief Enumeration of error codes for ean13 operations.
 * These codes can be converted to std::error_code for integration with
 * standard error handling mechanisms.
 * @note SUCCESS (0) indicates no error.
 * If starts with 'W' it is an input validation error (digits, codes, patterns).
 * If starts with 'G' it is a generation error.
 * If starts with 'D' it is an exclusion storage error.
 * @see std::error_code
 */
    enum class Status : int {
        SUCCESS = 0,    /**< No error */
        WBAD_DIGIT = 1, /**< Digit outside [0,9] */
        WBAD_LENGTH = 2, /**< Wrong number of digits */
        WBAD_PREFIX = 3, /**< Prefix is not a valid payload prefix */
        WBAD_CHECKSUM = 4, /**< Check digit mismatch */
        WBAD_PATTERN_LENGTH = 5, /**< Module pattern has wrong length */
        WBAD_GUARD = 6, /**< Guard marker mismatch */
        WBAD_ELEMENT = 7, /**< 7-module group not in the encoding tables */
        WBAD_PARITY = 8, /**< L/G sequence not in the parity table */
        WBAD_MODULE = 9, /**< Pattern text holds a non-module character */
        GEXHAUSTED = 10, /**< Attempt or time budget exhausted */
        DNOT_FOUND = 11, /**< Exclusion file not found */
        DREAD_ERROR = 12, /**< Exclusion file read error */
        DWRITE_ERROR = 13, /**< Exclusion file write error */
        UNKNOWN = 255   /**< Unknown error */
    };

/**
 * @class Ean13ErrorCategory
 * @brief Custom error category for ean13 errors.
 */
    class Ean13ErrorCategory : public std::error_category {
        public:
            const char*name() const noexcept override {
                return "ean13::Status";
            }

            std::string message(int ev) const override {
                switch (static_cast<Status>(ev)) {
                case Status::SUCCESS:
                    return "Success";
                case Status::WBAD_DIGIT:
                    return "Bad digit";
                case Status::WBAD_LENGTH:
                    return "Bad digit count";
                case Status::WBAD_PREFIX:
                    return "Bad prefix";
                case Status::WBAD_CHECKSUM:
                    return "Bad checksum";
                case Status::WBAD_PATTERN_LENGTH:
                    return "Bad pattern length";
                case Status::WBAD_GUARD:
                    return "Bad guard";
                case Status::WBAD_ELEMENT:
                    return "Bad digit element";
                case Status::WBAD_PARITY:
                    return "Bad parity sequence";
                case Status::WBAD_MODULE:
                    return "Bad module";
                case Status::GEXHAUSTED:
                    return "Generation exhausted";
                case Status::DNOT_FOUND:
                    return "Exclusion file not found";
                case Status::DREAD_ERROR:
                    return "Exclusion file read error";
                case Status::DWRITE_ERROR:
                    return "Exclusion file write error";
                case Status::UNKNOWN:
                    return "Unknown error";
                default:
                    return "Unrecognized error";
                }
            }
    };

// Get the error category instance
    inline const std::error_category &ean13_category() {
        static Ean13ErrorCategory instance;
        return instance;
    }

// Make error_code from Status
    inline std::error_code make_error_code(Status e) {
        return {static_cast<int>(e), ean13_category()};
    }

} // namespace ean13

// Register the enum for use with std::error_code
namespace std {
    template<> struct is_error_code_enum<ean13::Status> : true_type {};
} // namespace std

/**
 * @file ean13_exception.hpp
 * @brief Exception hierarchy for the ean13 library
 * @version 1.0
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <stdexcept>
#include <string>
#include "../enums/error.hpp"

namespace ean13 {

    /**
     * @class Ean13Exception
     * @brief Base exception class for all ean13 errors
     *
     * This exception stores the original Status code for programmatic error handling
     * while providing a descriptive error message via what().
     */
    class Ean13Exception : public std::runtime_error {
        protected:
            Status status_;     ///< Original error status code
            std::string context_; ///< Operation context (function name, offending input)

        public:
            /**
             * @brief Construct exception with status code and context
             * @param status The error status code
             * @param context Description of where the error occurred
             */
            Ean13Exception(Status status, const std::string& context)
                : std::runtime_error(format_message(status, context)),
                status_(status),
                context_(context) {}

            /**
             * @brief Get the status code
             * @return Status code associated with this exception
             */
            Status status() const noexcept { return status_; }

            /**
             * @brief Get the operation context
             * @return Context string describing where error occurred
             */
            const std::string& context() const noexcept { return context_; }

            /**
             * @brief Name of the error kind, as echoed by the command-line tool
             * @return "InvalidDigitError", "ChecksumMismatchError", ...
             */
            virtual const char* kind() const noexcept { return "Ean13Error"; }

        private:
            static std::string format_message(Status status, const std::string& context) {
                Ean13ErrorCategory category;
                return "[" + category.message(static_cast<int>(status)) + "] in " + context;
            }
    };

    // === Derived Exception Classes ===

    /**
     * @class InvalidDigitError
     * @brief A digit is outside [0,9] or a digit sequence has the wrong length.
     * Corresponds to WBAD_DIGIT, WBAD_LENGTH and WBAD_PREFIX.
     */
    class InvalidDigitError : public Ean13Exception {
        public:
            using Ean13Exception::Ean13Exception;
            const char* kind() const noexcept override { return "InvalidDigitError"; }
    };

    /**
     * @class ChecksumMismatchError
     * @brief A supplied or decoded code carries the wrong check digit.
     * Corresponds to WBAD_CHECKSUM.
     */
    class ChecksumMismatchError : public Ean13Exception {
        public:
            using Ean13Exception::Ean13Exception;
            const char* kind() const noexcept override { return "ChecksumMismatchError"; }
    };

    /**
     * @class MalformedPatternError
     * @brief A module pattern does not follow the EAN13 structure.
     * Corresponds to WBAD_PATTERN_LENGTH, WBAD_GUARD, WBAD_ELEMENT, WBAD_PARITY
     * and WBAD_MODULE.
     */
    class MalformedPatternError : public Ean13Exception {
        public:
            using Ean13Exception::Ean13Exception;
            const char* kind() const noexcept override { return "MalformedPatternError"; }
    };

    /**
     * @class ExhaustedError
     * @brief Constrained generation found no free code within its budget.
     * Corresponds to GEXHAUSTED. Callers may retry with a relaxed constraint.
     */
    class ExhaustedError : public Ean13Exception {
        public:
            using Ean13Exception::Ean13Exception;
            const char* kind() const noexcept override { return "ExhaustedError"; }
    };

    /**
     * @class StorageError
     * @brief Exclusion file could not be opened, read or written.
     * Corresponds to DNOT_FOUND, DREAD_ERROR and DWRITE_ERROR.
     */
    class StorageError : public Ean13Exception {
        public:
            using Ean13Exception::Ean13Exception;
            const char* kind() const noexcept override { return "StorageError"; }
    };

    // === Exception Factory Helpers ===

    /**
     * @brief Throw appropriate exception based on status code
     * @param status The error status code
     * @param context Description of where the error occurred
     * @throws InvalidDigitError for WBAD_DIGIT, WBAD_LENGTH, WBAD_PREFIX
     * @throws ChecksumMismatchError for WBAD_CHECKSUM
     * @throws MalformedPatternError for pattern related codes
     * @throws ExhaustedError for GEXHAUSTED
     * @throws StorageError for D* codes
     * @throws Ean13Exception for other codes
     */
    [[noreturn]] inline void throw_error(Status status, const std::string& context) {
        switch (status) {
        case Status::WBAD_DIGIT:
        case Status::WBAD_LENGTH:
        case Status::WBAD_PREFIX:
            throw InvalidDigitError(status, context);

        case Status::WBAD_CHECKSUM:
            throw ChecksumMismatchError(status, context);

        case Status::WBAD_PATTERN_LENGTH:
        case Status::WBAD_GUARD:
        case Status::WBAD_ELEMENT:
        case Status::WBAD_PARITY:
        case Status::WBAD_MODULE:
            throw MalformedPatternError(status, context);

        case Status::GEXHAUSTED:
            throw ExhaustedError(status, context);

        case Status::DNOT_FOUND:
        case Status::DREAD_ERROR:
        case Status::DWRITE_ERROR:
            throw StorageError(status, context);

        default:
            throw Ean13Exception(status, context);
        }
    }

    /**
     * @brief Throw if status indicates an error (not SUCCESS)
     * @param status The status code to check
     * @param context Description of where the error occurred
     */
    inline void throw_if_error(Status status, const std::string& context) {
        if (status != Status::SUCCESS) {
            throw_error(status, context);
        }
    }

} // namespace ean13

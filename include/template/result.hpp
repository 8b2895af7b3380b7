/**
 * @file result.hpp
 * @brief Value-or-status return type with an operation context chain.
 * @version 1.0
 * @date 2026-10-19
 * @copyright Copyright (c) 2026
 */

#pragma once
#include "../enums/error.hpp"
#include "../exception/ean13_exception.hpp"
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace ean13 {

/**
 * @brief Result type used by the non-throwing entry points (try_decode, try_generate).
 *
 * Holds either a value of type T or a Status. Each failure carries the chain of
 * operations it travelled through, so describe() reads like a short call stack:
 * "Error [Bad guard] [check_guards: center -> try_decode]".
 *
 * @tparam T The type of the value being returned.
 */
    template<typename T>
    class Result {
        private:
            std::variant<Status, T> value_or_error_;
            std::vector<std::string> context_chain_;

            explicit Result(Status status) : value_or_error_(status) {}
            explicit Result(T val) : value_or_error_(std::move(val)) {}

        public:
            bool ok() const {
                return std::holds_alternative<T>(value_or_error_);
            }

            bool fail() const {
                return !ok();
            }

            explicit operator bool() const {
                return ok();
            }

            // Value access (std::bad_variant_access if error)
            const T& value() const {
                return std::get<T>(value_or_error_);
            }

            T& value() {
                return std::get<T>(value_or_error_);
            }

            Status error() const {
                return fail() ? std::get<Status>(value_or_error_) : Status::SUCCESS;
            }

            const std::vector<std::string>& context_chain() const {
                return context_chain_;
            }

            std::string describe() const {
                if (ok()) return "Success";

                Ean13ErrorCategory category;
                std::string result = "Error [" + category.message(static_cast<int>(error())) +
                    "]";
                if (!context_chain_.empty()) {
                    result += " [";
                    for (std::size_t i = 0; i < context_chain_.size(); ++i) {
                        if (i > 0) result += " -> ";
                        result += context_chain_[i];
                    }
                    result += "]";
                }
                return result;
            }

            /**
             * @brief Unwrap the value or throw the exception matching the status
             * @param op Operation name appended to the exception context
             * @throws Ean13Exception subclass chosen by throw_error()
             */
            T value_or_throw(const std::string& op) const {
                if (fail()) {
                    throw_error(error(), describe_chain(op));
                }
                return value();
            }

            static Result success(T val) {
                return Result(std::move(val));
            }

            static Result error(Status status, const std::string& op = "") {
                Result r(status);
                if (!op.empty()) {
                    r.context_chain_.push_back(op);
                }
                return r;
            }

            // Propagate the failure of another Result, extending its chain
            template<typename U>
            static Result error(const Result<U>& failed, const std::string& op = "") {
                Result r(failed.error());
                r.context_chain_ = failed.context_chain();
                if (!op.empty()) {
                    r.context_chain_.push_back(op);
                }
                return r;
            }

        private:
            std::string describe_chain(const std::string& op) const {
                std::string chain;
                for (const auto& step : context_chain_) {
                    chain += step + " -> ";
                }
                return chain + op;
            }
    };

/**
 * @brief Specialization for checks that produce no value.
 */
    template<>
    class Result<void> {
        private:
            Status status_ = Status::SUCCESS;
            std::vector<std::string> context_chain_;

        public:
            bool ok() const {
                return status_ == Status::SUCCESS;
            }

            bool fail() const {
                return !ok();
            }

            explicit operator bool() const {
                return ok();
            }

            Status error() const {
                return status_;
            }

            const std::vector<std::string>& context_chain() const {
                return context_chain_;
            }

            static Result success() {
                return Result{};
            }

            static Result error(Status status, const std::string& op = "") {
                Result r;
                r.status_ = status;
                if (!op.empty()) {
                    r.context_chain_.push_back(op);
                }
                return r;
            }
    };

} // namespace ean13

/**
 * @file result.hpp
 * @brief Result type carrying a value or a Status with an error context chain.
 * @version 0.1
 * @date 2026-10-18
 */

#pragma once
#include "../enums/error.hpp"
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace tefmem {

/**
 * @brief Value-or-error return type used across the collaborator API.
 *
 * Failed results keep the originating Status plus a chain of context strings,
 * innermost first, so a caller can print where a failure came from
 * ("read_line timeout -> read_configuration").
 *
 * @tparam T The type of the value being returned.
 */
    template<typename T>
    class Result {
        private:
            std::variant<T, Status> value_or_error_;
            std::vector<std::string> error_chain_;

        public:
            Result() : value_or_error_(Status::UNKNOWN) {
            }

            bool ok() const {
                return std::holds_alternative<T>(value_or_error_);
            }

            bool fail() const {
                return !ok();
            }

            explicit operator bool() const {
                return ok();
            }

            // Value access (throws std::bad_variant_access if error)
            const T& value() const {
                return std::get<T>(value_or_error_);
            }

            T& value() {
                return std::get<T>(value_or_error_);
            }

            Status error() const {
                return fail() ? std::get<Status>(value_or_error_) : Status::SUCCESS;
            }

            /**
             * @brief Innermost context message, or empty on success
             */
            std::string message() const {
                if (ok() || error_chain_.empty()) {
                    return "";
                }
                return error_chain_.front();
            }

            std::string describe() const {
                if (ok()) return "Success";

                std::string result = tefmem_category().message(static_cast<int>(error()));
                if (!error_chain_.empty()) {
                    result += " [";
                    for (size_t i = 0; i < error_chain_.size(); ++i) {
                        if (i > 0) result += " -> ";
                        result += error_chain_[i];
                    }
                    result += "]";
                }
                return result;
            }

            const std::vector<std::string>& error_chain() const {
                return error_chain_;
            }

            static Result success(T val) {
                Result r;
                r.value_or_error_ = std::move(val);
                return r;
            }

            static Result error(Status status, const std::string& context = "") {
                Result r;
                r.value_or_error_ = status;
                if (!context.empty()) {
                    r.error_chain_.push_back(context);
                }
                return r;
            }

            // Propagate the error from another Result, appending our own context
            template<typename U>
            static Result error(const Result<U>& failed_result, const std::string& context = "") {
                Result r;
                r.value_or_error_ = failed_result.error();
                r.error_chain_ = failed_result.error_chain();
                if (!context.empty()) {
                    r.error_chain_.push_back(context);
                }
                return r;
            }
    };

} // namespace tefmem

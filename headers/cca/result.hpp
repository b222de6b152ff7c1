//
// Created by gregorian-rayne on 2/9/26.
//

#ifndef CCA_RESULT_HPP
#define CCA_RESULT_HPP

/**
 * @file result.hpp
 * @brief Value-or-Error return type for stores, analyzers and the coordinator.
 *
 * An analyzer running on a worker thread hands its outcome back through a
 * future, so failures are carried as values rather than thrown. Every
 * fallible call in the pipeline returns Result<T>; the error side is always
 * a cca::Error.
 *
 * @code
 *     auto id = store.new_submission_id(filename, content);
 *     if (id.is_err()) {
 *         return Result<Report>::failure(id.error());
 *     }
 *
 *     return store.ensure_schema(schema)
 *         .and_then([&] { return store.insert(table, rows); })
 *         .with_context("SecurityAnalyzer");
 * @endcode
 */

#include "cca/error.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace cca {

    template<typename T>
    class Result {
    public:
        static Result success(T value) {
            return Result(std::in_place_index<0>, std::move(value));
        }

        static Result failure(Error error) {
            return Result(std::in_place_index<1>, std::move(error));
        }

        [[nodiscard]] bool is_ok() const noexcept { return state_.index() == 0; }
        [[nodiscard]] bool is_err() const noexcept { return state_.index() == 1; }

        explicit operator bool() const noexcept { return is_ok(); }

        /// @throws std::logic_error when holding an error.
        T& value() & {
            check_ok();
            return std::get<0>(state_);
        }

        const T& value() const& {
            check_ok();
            return std::get<0>(state_);
        }

        T&& value() && {
            check_ok();
            return std::get<0>(std::move(state_));
        }

        /// @throws std::logic_error when holding a value.
        const Error& error() const {
            if (is_ok()) {
                throw std::logic_error("error() called on a successful Result");
            }
            return std::get<1>(state_);
        }

        T value_or(T fallback) const& {
            return is_ok() ? std::get<0>(state_) : std::move(fallback);
        }

        /**
         * Runs the next fallible step on the held value. An error skips the
         * step and is carried into the step's result type.
         */
        template<typename F>
        auto and_then(F&& next) && -> std::invoke_result_t<F, T&&> {
            using Next = std::invoke_result_t<F, T&&>;
            if (is_err()) {
                return Next::failure(std::get<1>(std::move(state_)));
            }
            return std::forward<F>(next)(std::get<0>(std::move(state_)));
        }

        /// Appends @p context to a held error. Values pass through.
        Result with_context(const std::string& context) && {
            if (is_err()) {
                return failure(std::get<1>(state_).with_context(context));
            }
            return std::move(*this);
        }

    private:
        template<std::size_t I, typename V>
        Result(std::in_place_index_t<I> index, V&& held) : state_(index, std::forward<V>(held)) {}

        void check_ok() const {
            if (is_err()) {
                throw std::logic_error("value() called on a failed Result: " +
                                       std::get<1>(state_).to_string());
            }
        }

        std::variant<T, Error> state_;
    };

    /// Outcome of a step with nothing to return (schema creation, closing a store).
    template<>
    class Result<void> {
    public:
        static Result success() { return Result(std::nullopt); }
        static Result failure(Error error) { return Result(std::move(error)); }

        [[nodiscard]] bool is_ok() const noexcept { return !error_; }
        [[nodiscard]] bool is_err() const noexcept { return error_.has_value(); }

        explicit operator bool() const noexcept { return is_ok(); }

        const Error& error() const {
            if (!error_) {
                throw std::logic_error("error() called on a successful Result");
            }
            return *error_;
        }

        template<typename F>
        auto and_then(F&& next) const -> std::invoke_result_t<F> {
            if (error_) {
                return std::invoke_result_t<F>::failure(*error_);
            }
            return std::forward<F>(next)();
        }

        Result with_context(const std::string& context) const {
            return error_ ? failure(error_->with_context(context)) : success();
        }

    private:
        explicit Result(std::optional<Error> error) : error_(std::move(error)) {}

        std::optional<Error> error_;
    };

}  // namespace cca

#endif //CCA_RESULT_HPP

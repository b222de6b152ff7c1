//
// Created by gregorian-rayne on 2/9/26.
//

#ifndef CCA_ERROR_HPP
#define CCA_ERROR_HPP

/**
 * @file error.hpp
 * @brief The error carried by every failed Result.
 *
 * An Error is a code, a human-readable message and an optional context
 * trail. Each layer that forwards an error appends where it happened, so a
 * failed fork write reaches the CLI as
 *
 *     [StoreError] unable to open database file (context: sqlite:///q.db; Quality analyzer)
 */

#include <optional>
#include <ostream>
#include <string>
#include <utility>

namespace cca {

    enum class ErrorCode {
        InvalidArgument,  ///< Caller passed an unusable value (bad table name, bad id)
        NotFound,         ///< Submission or input file does not exist
        ParseError,       ///< Stored row or TOML document could not be decoded
        IoError,          ///< Reading an input or config file failed
        ConfigError,      ///< Missing or invalid configuration; fatal at startup
        StoreError,       ///< Finding store unreachable or statement rejected
        AnalysisError,    ///< Analyzer refused its input
        InternalError     ///< Worker threw or an invariant broke
    };

    inline const char* to_string(const ErrorCode code) noexcept {
        switch (code) {
            case ErrorCode::InvalidArgument: return "InvalidArgument";
            case ErrorCode::NotFound:        return "NotFound";
            case ErrorCode::ParseError:      return "ParseError";
            case ErrorCode::IoError:         return "IoError";
            case ErrorCode::ConfigError:     return "ConfigError";
            case ErrorCode::StoreError:      return "StoreError";
            case ErrorCode::AnalysisError:   return "AnalysisError";
            case ErrorCode::InternalError:   return "InternalError";
        }
        return "Unknown";
    }

    class Error {
    public:
        Error(const ErrorCode code, std::string message, std::optional<std::string> context = std::nullopt)
            : code_(code)
            , message_(std::move(message))
            , context_(std::move(context)) {}

        static Error invalid_argument(std::string message, std::optional<std::string> context = std::nullopt) {
            return {ErrorCode::InvalidArgument, std::move(message), std::move(context)};
        }

        static Error not_found(std::string message, std::optional<std::string> context = std::nullopt) {
            return {ErrorCode::NotFound, std::move(message), std::move(context)};
        }

        static Error parse_error(std::string message, std::optional<std::string> context = std::nullopt) {
            return {ErrorCode::ParseError, std::move(message), std::move(context)};
        }

        static Error io_error(std::string message, std::optional<std::string> context = std::nullopt) {
            return {ErrorCode::IoError, std::move(message), std::move(context)};
        }

        static Error config_error(std::string message, std::optional<std::string> context = std::nullopt) {
            return {ErrorCode::ConfigError, std::move(message), std::move(context)};
        }

        /// The context of a store error is the store URL or table involved.
        static Error store_error(std::string message, std::optional<std::string> context = std::nullopt) {
            return {ErrorCode::StoreError, std::move(message), std::move(context)};
        }

        static Error analysis_error(std::string message, std::optional<std::string> context = std::nullopt) {
            return {ErrorCode::AnalysisError, std::move(message), std::move(context)};
        }

        static Error internal_error(std::string message, std::optional<std::string> context = std::nullopt) {
            return {ErrorCode::InternalError, std::move(message), std::move(context)};
        }

        [[nodiscard]] ErrorCode code() const noexcept { return code_; }
        [[nodiscard]] const std::string& message() const noexcept { return message_; }
        [[nodiscard]] const std::optional<std::string>& context() const noexcept { return context_; }
        [[nodiscard]] bool has_context() const noexcept { return context_.has_value(); }

        /**
         * Returns a copy with @p where appended to the context trail,
         * separated from earlier entries by "; ".
         */
        [[nodiscard]] Error with_context(const std::string& where) const {
            return {code_, message_, context_ ? *context_ + "; " + where : where};
        }

        /// "[Code] message" followed by " (context: ...)" when a trail exists.
        [[nodiscard]] std::string to_string() const {
            std::string text = std::string("[") + cca::to_string(code_) + "] " + message_;
            if (context_) {
                text += " (context: " + *context_ + ")";
            }
            return text;
        }

        bool operator==(const Error&) const = default;

    private:
        ErrorCode code_;
        std::string message_;
        std::optional<std::string> context_;
    };

    inline std::ostream& operator<<(std::ostream& os, const Error& error) {
        return os << error.to_string();
    }

}  // namespace cca

#endif //CCA_ERROR_HPP

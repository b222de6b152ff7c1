//
// Created by gregorian-rayne on 2/10/26.
//

#ifndef CCA_LOGGING_HPP
#define CCA_LOGGING_HPP

/**
 * @file logging.hpp
 * @brief Process-wide "cca" logger built on spdlog.
 *
 * Log lines go to stderr so that `--json` output on stdout stays parseable.
 * An optional file sink receives the same lines without colour codes.
 */

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace cca::logging {

    inline constexpr auto DEFAULT_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v";
    inline constexpr auto LOGGER_NAME = "cca";

    /**
     * (Re)creates the logger. Safe to call more than once; the previous
     * sinks are replaced.
     *
     * @param level One of trace, debug, info, warn, error, critical, off.
     * @param pattern spdlog pattern string.
     * @param file Optional log file path; empty disables the file sink.
     */
    void init(const std::string& level = "info",
              const std::string& pattern = DEFAULT_PATTERN,
              const std::string& file = "");

    /**
     * Returns the logger, initializing it with defaults on first use.
     */
    std::shared_ptr<spdlog::logger> get_logger();

    /**
     * Changes the level of the existing logger. Unknown names fall back to
     * info with a warning.
     */
    void set_level(const std::string& level);

    /**
     * Returns true when the name is a level accepted by set_level().
     */
    bool is_valid_level(const std::string& level) noexcept;

}  // namespace cca::logging

#define CCA_LOG_TRACE(...)    SPDLOG_LOGGER_TRACE(::cca::logging::get_logger(), __VA_ARGS__)
#define CCA_LOG_DEBUG(...)    SPDLOG_LOGGER_DEBUG(::cca::logging::get_logger(), __VA_ARGS__)
#define CCA_LOG_INFO(...)     SPDLOG_LOGGER_INFO(::cca::logging::get_logger(), __VA_ARGS__)
#define CCA_LOG_WARN(...)     SPDLOG_LOGGER_WARN(::cca::logging::get_logger(), __VA_ARGS__)
#define CCA_LOG_ERROR(...)    SPDLOG_LOGGER_ERROR(::cca::logging::get_logger(), __VA_ARGS__)
#define CCA_LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(::cca::logging::get_logger(), __VA_ARGS__)

#endif //CCA_LOGGING_HPP

//
// Created by gregorian-rayne on 2/10/26.
//

#include "cca/logging.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>
#include <vector>

namespace cca::logging {

    namespace {
        std::shared_ptr<spdlog::logger> g_logger;
        std::mutex g_logger_mutex;

        spdlog::level::level_enum parse_level(const std::string& level, bool& known) noexcept {
            known = true;
            if (level == "trace") return spdlog::level::trace;
            if (level == "debug") return spdlog::level::debug;
            if (level == "info") return spdlog::level::info;
            if (level == "warn" || level == "warning") return spdlog::level::warn;
            if (level == "error") return spdlog::level::err;
            if (level == "critical") return spdlog::level::critical;
            if (level == "off") return spdlog::level::off;
            known = false;
            return spdlog::level::info;
        }

        void apply_level(const std::shared_ptr<spdlog::logger>& logger, const std::string& level) {
            bool known = false;
            logger->set_level(parse_level(level, known));
            if (!known) {
                logger->warn("Unknown log level '{}', using 'info'", level);
            }
        }
    }

    void init(const std::string& level, const std::string& pattern, const std::string& file) {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

        std::string file_error;
        if (!file.empty()) {
            try {
                sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(file, false));
            } catch (const spdlog::spdlog_ex& ex) {
                file_error = ex.what();
            }
        }

        auto logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
        logger->set_pattern(pattern);
        logger->flush_on(spdlog::level::warn);
        apply_level(logger, level);

        {
            std::scoped_lock lock(g_logger_mutex);
            g_logger = logger;
        }

        if (!file_error.empty()) {
            logger->warn("Could not open log file '{}': {}", file, file_error);
        }
    }

    std::shared_ptr<spdlog::logger> get_logger() {
        {
            std::scoped_lock lock(g_logger_mutex);
            if (g_logger) {
                return g_logger;
            }
        }
        init();
        std::scoped_lock lock(g_logger_mutex);
        return g_logger;
    }

    void set_level(const std::string& level) {
        apply_level(get_logger(), level);
    }

    bool is_valid_level(const std::string& level) noexcept {
        bool known = false;
        parse_level(level, known);
        return known;
    }

}  // namespace cca::logging

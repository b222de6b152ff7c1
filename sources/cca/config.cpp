//
// Created by gregorian-rayne on 2/10/26.
//

#include "cca/config.hpp"
#include "cca/storage/store_url.hpp"

#include <toml++/toml.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <utility>

namespace cca {

    namespace {
        constexpr auto PRIMARY_URL_VARIABLE = "DATABASE_URL";
        constexpr auto FAILURE_POLICY_VARIABLE = "CCA_FAILURE_POLICY";

        /**
         * Reads an optional string key. A present key of another type is an error.
         */
        Result<std::optional<std::string>> read_string(const toml::node_view<toml::node> node,
                                                       const std::string& key) {
            if (!node) {
                return Result<std::optional<std::string>>::success(std::nullopt);
            }
            auto value = node.value<std::string>();
            if (!value) {
                return Result<std::optional<std::string>>::failure(
                    Error::config_error("Expected a string value", key));
            }
            return Result<std::optional<std::string>>::success(std::move(value));
        }

        Result<FailurePolicy> parse_policy(const std::string& value, const std::string& source) {
            const auto policy = failure_policy_from_string(value);
            if (!policy) {
                return Result<FailurePolicy>::failure(Error::config_error(
                    "Unknown failure policy '" + value + "' (expected all_or_nothing or best_effort)",
                    source));
            }
            return Result<FailurePolicy>::success(*policy);
        }
    }

    Result<void> CoordinatorConfig::validate() const {
        if (primary_store_url.empty()) {
            return Result<void>::failure(Error::config_error(
                "No primary store URL configured",
                "set [store] primary, DATABASE_URL or --store"));
        }

        if (auto primary = storage::parse_store_url(primary_store_url); primary.is_err()) {
            return Result<void>::failure(primary.error().with_context("primary store"));
        }

        for (const auto category : ALL_CATEGORIES) {
            const auto& fork = fork_urls[index_of(category)];
            if (!fork) {
                continue;
            }
            if (auto parsed = storage::parse_store_url(*fork); parsed.is_err()) {
                return Result<void>::failure(parsed.error().with_context(
                    std::string(to_string(category)) + " fork"));
            }
        }

        if (!logging::is_valid_level(logging.level)) {
            return Result<void>::failure(Error::config_error(
                "Unknown log level '" + logging.level + "'", "logging.level"));
        }

        return Result<void>::success();
    }

    bool CoordinatorConfig::forked_mode() const noexcept {
        return has_fork(Category::Security) && has_fork(Category::Quality);
    }

    bool CoordinatorConfig::has_fork(const Category category) const noexcept {
        const auto& fork = fork_urls[index_of(category)];
        return fork.has_value() && !fork->empty();
    }

    const std::string& CoordinatorConfig::store_url_for(const Category category) const noexcept {
        if (has_fork(category)) {
            return *fork_urls[index_of(category)];
        }
        return primary_store_url;
    }

    void CoordinatorConfig::set_fork(const Category category, const std::string& url) {
        if (url.empty()) {
            fork_urls[index_of(category)].reset();
        } else {
            fork_urls[index_of(category)] = url;
        }
    }

    Result<CoordinatorConfig> load_config_from_file(const std::string& path) {
        namespace fs = std::filesystem;

        std::error_code ec;
        if (!fs::exists(path, ec)) {
            return Result<CoordinatorConfig>::failure(
                Error::config_error("Configuration file not found", path));
        }

        std::ifstream file(path);
        if (!file) {
            return Result<CoordinatorConfig>::failure(
                Error::io_error("Cannot open configuration file", path));
        }

        std::ostringstream buffer;
        buffer << file.rdbuf();

        auto config = load_config_from_string(buffer.str());
        if (config.is_err()) {
            return Result<CoordinatorConfig>::failure(config.error().with_context(path));
        }
        return config;
    }

    Result<CoordinatorConfig> load_config_from_string(const std::string& content) {
        toml::table tbl;
        try {
            tbl = toml::parse(content);
        } catch (const toml::parse_error& err) {
            return Result<CoordinatorConfig>::failure(Error::config_error(
                "Failed to parse TOML configuration: " + std::string(err.description())));
        }

        CoordinatorConfig config;

        auto primary = read_string(tbl["store"]["primary"], "store.primary");
        if (primary.is_err()) {
            return Result<CoordinatorConfig>::failure(primary.error());
        }
        if (primary.value()) {
            config.primary_store_url = *primary.value();
        }

        for (const auto category : ALL_CATEGORIES) {
            const std::string key = to_string(category);
            auto fork = read_string(tbl["store"]["forks"][key], "store.forks." + key);
            if (fork.is_err()) {
                return Result<CoordinatorConfig>::failure(fork.error());
            }
            if (fork.value()) {
                config.set_fork(category, *fork.value());
            }
        }

        auto policy = read_string(tbl["analysis"]["failure_policy"], "analysis.failure_policy");
        if (policy.is_err()) {
            return Result<CoordinatorConfig>::failure(policy.error());
        }
        if (policy.value()) {
            auto parsed = parse_policy(*policy.value(), "analysis.failure_policy");
            if (parsed.is_err()) {
                return Result<CoordinatorConfig>::failure(parsed.error());
            }
            config.failure_policy = parsed.value();
        }

        const std::pair<const char*, std::string*> logging_keys[] = {
            {"level", &config.logging.level},
            {"file", &config.logging.file},
            {"pattern", &config.logging.pattern},
        };
        for (const auto& [key, target] : logging_keys) {
            auto value = read_string(tbl["logging"][key], std::string("logging.") + key);
            if (value.is_err()) {
                return Result<CoordinatorConfig>::failure(value.error());
            }
            if (value.value()) {
                *target = *value.value();
            }
        }

        return Result<CoordinatorConfig>::success(std::move(config));
    }

    std::optional<std::string> system_environment(const std::string& name) {
        if (const char* value = std::getenv(name.c_str())) {
            return std::string(value);
        }
        return std::nullopt;
    }

    const char* fork_environment_variable(const Category category) noexcept {
        switch (category) {
            case Category::Security:      return "SECURITY_FORK_URL";
            case Category::Quality:       return "QUALITY_FORK_URL";
            case Category::Performance:   return "PERFORMANCE_FORK_URL";
            case Category::BestPractices: return "BEST_PRACTICES_FORK_URL";
        }
        return "";
    }

    Result<void> apply_environment(CoordinatorConfig& config, const EnvironmentLookup& lookup) {
        const auto get = [&lookup](const std::string& name) -> std::optional<std::string> {
            auto value = lookup(name);
            if (value && value->empty()) {
                return std::nullopt;
            }
            return value;
        };

        if (auto primary = get(PRIMARY_URL_VARIABLE)) {
            config.primary_store_url = *primary;
        }

        for (const auto category : ALL_CATEGORIES) {
            if (auto fork = get(fork_environment_variable(category))) {
                config.set_fork(category, *fork);
            }
        }

        if (auto policy = get(FAILURE_POLICY_VARIABLE)) {
            auto parsed = parse_policy(*policy, FAILURE_POLICY_VARIABLE);
            if (parsed.is_err()) {
                return Result<void>::failure(parsed.error());
            }
            config.failure_policy = parsed.value();
        }

        return Result<void>::success();
    }

    Result<CoordinatorConfig> config_from_environment(const EnvironmentLookup& lookup) {
        CoordinatorConfig config;
        if (auto applied = apply_environment(config, lookup); applied.is_err()) {
            return Result<CoordinatorConfig>::failure(applied.error());
        }
        return Result<CoordinatorConfig>::success(std::move(config));
    }

}  // namespace cca

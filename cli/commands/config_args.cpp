//
// Created by gregorian-rayne on 2/12/26.
//

#include "cca/cli/commands/config_args.hpp"
#include "cca/logging.hpp"

#include <array>
#include <utility>

namespace cca::cli
{
    namespace {
        constexpr std::array<std::pair<Category, const char*>, CATEGORY_COUNT> FORK_FLAGS = {{
            {Category::Security, "security-fork"},
            {Category::Quality, "quality-fork"},
            {Category::Performance, "performance-fork"},
            {Category::BestPractices, "best-practices-fork"},
        }};
    }

    std::vector<ArgDef> config_arguments() {
        return {
            {"config", 'c', "TOML configuration file", false, true, "", "FILE"},
            {"store", 's', "Primary store URL (overrides DATABASE_URL)", false, true, "", "URL"},
            {"security-fork", 0, "Isolated store for the security analyzer", false, true, "", "URL"},
            {"quality-fork", 0, "Isolated store for the quality analyzer", false, true, "", "URL"},
            {"performance-fork", 0, "Isolated store for the performance analyzer", false, true, "", "URL"},
            {"best-practices-fork", 0, "Isolated store for the best practices analyzer", false, true, "", "URL"},
            {"policy", 'p', "Failure policy (all_or_nothing, best_effort)", false, true, "", "POLICY"},
            {"log-level", 0, "Log level (trace, debug, info, warn, error, off)", false, true, "", "LEVEL"},
            {"log-file", 0, "Also write log lines to this file", false, true, "", "FILE"},
        };
    }

    Result<CoordinatorConfig> resolve_config(const ParsedArgs& args, const EnvironmentLookup& lookup) {
        CoordinatorConfig config;

        if (const auto path = args.get("config")) {
            auto loaded = load_config_from_file(*path);
            if (loaded.is_err()) {
                return loaded;
            }
            config = std::move(loaded).value();
        }

        if (auto env = apply_environment(config, lookup); env.is_err()) {
            return Result<CoordinatorConfig>::failure(env.error());
        }

        if (const auto store = args.get("store")) {
            config.primary_store_url = *store;
        }
        for (const auto& [category, flag] : FORK_FLAGS) {
            if (const auto url = args.get(flag)) {
                config.set_fork(category, *url);
            }
        }
        if (const auto policy = args.get("policy")) {
            const auto parsed = failure_policy_from_string(*policy);
            if (!parsed) {
                return Result<CoordinatorConfig>::failure(Error::config_error(
                    "Unknown failure policy '" + *policy + "'", "--policy"));
            }
            config.failure_policy = *parsed;
        }
        if (const auto level = args.get("log-level")) {
            config.logging.level = *level;
        }
        if (const auto file = args.get("log-file")) {
            config.logging.file = *file;
        }

        if (auto valid = config.validate(); valid.is_err()) {
            return Result<CoordinatorConfig>::failure(valid.error());
        }
        return Result<CoordinatorConfig>::success(std::move(config));
    }

    void init_logging(const CoordinatorConfig& config, const ParsedArgs& args) {
        logging::init(config.logging.level, config.logging.pattern, config.logging.file);
        if (args.get_flag("verbose") && !args.has("log-level")) {
            logging::set_level("debug");
        }
    }

}  // namespace cca::cli

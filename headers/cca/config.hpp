//
// Created by gregorian-rayne on 2/10/26.
//

#ifndef CCA_CONFIG_HPP
#define CCA_CONFIG_HPP

/**
 * @file config.hpp
 * @brief Coordinator configuration and its loaders.
 *
 * A CoordinatorConfig is a plain value. It is built from a TOML file, the
 * process environment and command-line flags (in increasing precedence),
 * validated once, and then fully determines how submissions are executed.
 *
 * TOML layout:
 * @code
 *     [store]
 *     primary = "sqlite:///var/lib/cca/main.db"
 *
 *     [store.forks]
 *     security = "sqlite:///var/lib/cca/security.db"
 *     quality = "sqlite:///var/lib/cca/quality.db"
 *
 *     [analysis]
 *     failure_policy = "all_or_nothing"
 *
 *     [logging]
 *     level = "info"
 * @endcode
 */

#include "cca/types.hpp"
#include "cca/result.hpp"
#include "cca/logging.hpp"

#include <array>
#include <functional>
#include <optional>
#include <string>

namespace cca {

    struct LoggingSettings {
        std::string level = "info";
        std::string file;
        std::string pattern = logging::DEFAULT_PATTERN;
    };

    struct CoordinatorConfig {
        std::string primary_store_url;
        std::array<std::optional<std::string>, CATEGORY_COUNT> fork_urls;
        FailurePolicy failure_policy = FailurePolicy::AllOrNothing;
        LoggingSettings logging;

        /**
         * Checks that a primary URL is present and that every configured URL
         * has a supported scheme. Fails with ConfigError.
         */
        [[nodiscard]] Result<void> validate() const;

        /**
         * Forked mode requires isolated stores for at least security and
         * quality.
         */
        [[nodiscard]] bool forked_mode() const noexcept;

        [[nodiscard]] ExecutionMode execution_mode() const noexcept {
            return forked_mode() ? ExecutionMode::Forked : ExecutionMode::Sequential;
        }

        [[nodiscard]] bool has_fork(Category category) const noexcept;

        /**
         * The fork URL of a category, or the primary URL when it has none.
         */
        [[nodiscard]] const std::string& store_url_for(Category category) const noexcept;

        /**
         * Sets or clears a fork URL. Empty strings clear.
         */
        void set_fork(Category category, const std::string& url);
    };

    /**
     * Reads a TOML configuration file. The result is not validated, since
     * environment or flags may still supply the primary URL.
     */
    [[nodiscard]] Result<CoordinatorConfig> load_config_from_file(const std::string& path);

    [[nodiscard]] Result<CoordinatorConfig> load_config_from_string(const std::string& content);

    /**
     * Returns the value of a variable, or nullopt when it is unset.
     */
    using EnvironmentLookup = std::function<std::optional<std::string>(const std::string& name)>;

    /**
     * Lookup backed by std::getenv.
     */
    [[nodiscard]] std::optional<std::string> system_environment(const std::string& name);

    /**
     * Overlays DATABASE_URL, SECURITY_FORK_URL, QUALITY_FORK_URL,
     * PERFORMANCE_FORK_URL, BEST_PRACTICES_FORK_URL and CCA_FAILURE_POLICY
     * onto config. Empty variables count as unset.
     */
    [[nodiscard]] Result<void> apply_environment(CoordinatorConfig& config,
                                                 const EnvironmentLookup& lookup = system_environment);

    /**
     * Builds a configuration from the environment alone.
     */
    [[nodiscard]] Result<CoordinatorConfig> config_from_environment(
        const EnvironmentLookup& lookup = system_environment);

    /**
     * Name of the environment variable holding a category's fork URL.
     */
    [[nodiscard]] const char* fork_environment_variable(Category category) noexcept;

}  // namespace cca

#endif //CCA_CONFIG_HPP

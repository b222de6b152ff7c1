//
// Created by gregorian-rayne on 2/12/26.
//

#ifndef CCA_CONFIG_ARGS_HPP
#define CCA_CONFIG_ARGS_HPP

/**
 * @file config_args.hpp
 * @brief Store and logging options shared by every command that opens a store.
 *
 * The effective configuration is layered: the TOML file named by --config,
 * then the environment, then the command-line flags. The result is
 * validated before it is returned.
 */

#include "cca/cli/commands/command.hpp"
#include "cca/config.hpp"
#include "cca/result.hpp"

#include <vector>

namespace cca::cli
{
    /**
     * --config, --store, the four fork flags, --policy, --log-level and
     * --log-file.
     */
    [[nodiscard]] std::vector<ArgDef> config_arguments();

    /**
     * Builds and validates the configuration for a command.
     *
     * @param args Parsed arguments containing config_arguments().
     * @param lookup Environment source. Tests pass a fake.
     */
    [[nodiscard]] Result<CoordinatorConfig> resolve_config(
        const ParsedArgs& args,
        const EnvironmentLookup& lookup = system_environment);

    /**
     * Initializes the process logger from the resolved configuration.
     * --verbose raises the level to debug unless --log-level was given.
     */
    void init_logging(const CoordinatorConfig& config, const ParsedArgs& args);

}  // namespace cca::cli

#endif //CCA_CONFIG_ARGS_HPP

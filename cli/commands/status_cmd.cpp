//
// Created by gregorian-rayne on 2/12/26.
//

#include "cca/cli/commands/command.hpp"
#include "cca/cli/commands/config_args.hpp"
#include "cca/cli/formatter.hpp"
#include "cca/report.hpp"
#include "cca/storage/finding_store.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>

namespace cca::cli
{
    namespace {
        struct StoreStatus {
            std::string role;
            std::string url;
            bool reachable = false;
            std::string error;
        };

        StoreStatus check_store(std::string role, const std::string& url) {
            StoreStatus status{std::move(role), url};

            auto store = storage::open_existing_store(url);
            if (store.is_err()) {
                status.error = store.error().to_string();
                return status;
            }
            if (auto ping = store.value()->ping(); ping.is_err()) {
                status.error = ping.error().to_string();
                return status;
            }
            status.reachable = true;
            return status;
        }
    }

    /**
     * Status command - shows the configured stores, whether each one can be
     * opened, and the execution mode a submission would use.
     */
    class StatusCommand : public Command {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "status";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Check store connectivity and show the selected execution mode";
        }

        [[nodiscard]] std::vector<ArgDef> arguments() const override {
            return config_arguments();
        }

        [[nodiscard]] int execute(const ParsedArgs& args) override {
            apply_common_flags(args);

            auto resolved = resolve_config(args);
            if (resolved.is_err()) {
                print_error(resolved.error().to_string());
                return 1;
            }
            const auto& config = resolved.value();
            init_logging(config, args);

            std::vector<StoreStatus> stores;
            stores.push_back(check_store("primary", config.primary_store_url));
            for (const auto category : ALL_CATEGORIES) {
                if (config.has_fork(category)) {
                    stores.push_back(check_store(std::string(to_string(category)) + " fork",
                                           config.store_url_for(category)));
                }
            }

            const bool all_reachable = std::ranges::all_of(stores, [](const StoreStatus& s) {
                return s.reachable;
            });

            if (is_json()) {
                nlohmann::json j;
                j["mode"] = to_string(config.execution_mode());
                j["failure_policy"] = to_string(config.failure_policy);
                j["stores"] = nlohmann::json::array();
                for (const auto& store : stores) {
                    nlohmann::json entry = {
                        {"role", store.role},
                        {"url", store.url},
                        {"reachable", store.reachable}
                    };
                    if (!store.error.empty()) {
                        entry["error"] = store.error;
                    }
                    j["stores"].push_back(std::move(entry));
                }
                out() << report::dump_json(j) << "\n";
                return all_reachable ? 0 : 1;
            }

            if (!is_quiet()) {
                out() << "Execution Mode:       " << to_string(config.execution_mode()) << "\n";
                out() << "Failure Policy:       " << to_string(config.failure_policy) << "\n\n";

                Table table({
                    {"Store", 0, false},
                    {"Status", 0, false},
                    {"URL", 60, false},
                });
                for (const auto& store : stores) {
                    table.add_row({store.role, store.reachable ? "ok" : "unreachable", store.url});
                }
                table.render(out());
            }

            for (const auto& store : stores) {
                if (!store.reachable) {
                    print_error(store.role + " store: " + store.error);
                }
            }

            return all_reachable ? 0 : 1;
        }
    };

    namespace {
        struct StatusCommandRegistrar {
            StatusCommandRegistrar() {
                CommandRegistry::instance().register_command(
                    std::make_unique<StatusCommand>()
                );
            }
        } status_registrar;
    }
}  // namespace cca::cli

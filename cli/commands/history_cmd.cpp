//
// Created by gregorian-rayne on 2/12/26.
//

#include "cca/cli/commands/command.hpp"
#include "cca/cli/commands/config_args.hpp"
#include "cca/cli/formatter.hpp"

#include "cca/report.hpp"
#include "cca/storage/finding_store.hpp"

namespace cca::cli
{
    /**
     * History command - lists recent submissions, newest first.
     */
    class HistoryCommand : public Command {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "history";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "List recent submissions in the primary store";
        }

        [[nodiscard]] std::vector<ArgDef> arguments() const override {
            auto args = config_arguments();
            args.push_back({"limit", 'n', "Number of submissions to list", false, true, "20", "N"});
            return args;
        }

        [[nodiscard]] std::string validate(const ParsedArgs& args) const override {
            if (const auto limit = args.get_int("limit"); !limit || *limit <= 0) {
                return "--limit expects a positive integer";
            }
            return Command::validate(args);
        }

        [[nodiscard]] int execute(const ParsedArgs& args) override {
            apply_common_flags(args);

            auto config = resolve_config(args);
            if (config.is_err()) {
                print_error(config.error().to_string());
                return 1;
            }
            init_logging(config.value(), args);

            auto store = storage::open_store(config.value().primary_store_url);
            if (store.is_err()) {
                print_error(store.error().to_string());
                return 1;
            }

            const auto limit = static_cast<std::size_t>(args.get_int("limit").value_or(20));
            auto submissions = store.value()->list_submissions(limit);
            if (submissions.is_err()) {
                print_error(submissions.error().to_string());
                return 1;
            }

            if (is_json()) {
                nlohmann::json j = nlohmann::json::array();
                for (const auto& submission : submissions.value()) {
                    j.push_back(report::submission_to_json(submission));
                }
                out() << report::dump_json(j) << "\n";
            } else if (!is_quiet()) {
                SummaryPrinter printer(out());
                printer.print_history(submissions.value());
            }

            return 0;
        }
    };

    namespace {
        struct HistoryCommandRegistrar {
            HistoryCommandRegistrar() {
                CommandRegistry::instance().register_command(
                    std::make_unique<HistoryCommand>()
                );
            }
        } history_registrar;
    }
}  // namespace cca::cli

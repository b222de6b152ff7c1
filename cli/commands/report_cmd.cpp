//
// Created by gregorian-rayne on 2/12/26.
//

#include "cca/cli/commands/command.hpp"
#include "cca/cli/commands/config_args.hpp"
#include "cca/cli/formatter.hpp"

#include "cca/report.hpp"
#include "cca/storage/finding_store.hpp"

#include <fstream>

namespace cca::cli
{
    /**
     * Report command - rebuilds a report from the merged findings of a past
     * submission.
     */
    class ReportCommand : public Command {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "report";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Show the stored report of a previous submission";
        }

        [[nodiscard]] std::string usage() const override {
            return Command::usage() + "\n"
                   "\n"
                   "Examples:\n"
                   "  cca report --store sqlite://cca.db 42\n"
                   "  cca report --json 42";
        }

        [[nodiscard]] std::vector<ArgDef> arguments() const override {
            auto args = config_arguments();
            args.push_back({"output", 'o', "Also write the JSON report to this file", false, true, "", "FILE"});
            args.push_back({"top", 't', "Findings to show per category (0=all)", false, true, "0", "N"});
            return args;
        }

        [[nodiscard]] std::vector<PositionalDef> positionals() const override {
            return {{"SUBMISSION_ID", "Id printed by 'cca analyze' or 'cca history'"}};
        }

        [[nodiscard]] std::string validate(const ParsedArgs& args) const override {
            if (auto error = Command::validate(args); !error.empty()) {
                return error;
            }
            if (const auto id = parse_int64(args.positional().front()); !id || *id <= 0) {
                return "Invalid submission id: " + args.positional().front();
            }
            if (const auto top = args.get_int("top"); !top || *top < 0) {
                return "--top expects a non-negative integer";
            }
            return "";
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

            const SubmissionId id = *parse_int64(args.positional().front());
            auto loaded = report::load_report(*store.value(), id);
            if (loaded.is_err()) {
                print_error(loaded.error().to_string());
                return 1;
            }

            const auto document = report::report_to_json(loaded.value());
            if (is_json()) {
                out() << report::dump_json(document) << "\n";
            } else if (!is_quiet()) {
                SummaryPrinter printer(out());
                printer.print_report_summary(loaded.value());
                printer.print_findings(loaded.value(), static_cast<std::size_t>(args.get_int("top").value_or(0)));
            }

            if (auto output_file = args.get("output")) {
                std::ofstream output(*output_file);
                if (!output) {
                    print_error("Failed to open output file: " + *output_file);
                    return 1;
                }
                output << report::dump_json(document) << "\n";
            }

            return 0;
        }
    };

    namespace {
        struct ReportCommandRegistrar {
            ReportCommandRegistrar() {
                CommandRegistry::instance().register_command(
                    std::make_unique<ReportCommand>()
                );
            }
        } report_registrar;
    }
}  // namespace cca::cli

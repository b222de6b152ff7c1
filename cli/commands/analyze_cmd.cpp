//
// Created by gregorian-rayne on 2/12/26.
//

#include "cca/cli/commands/command.hpp"
#include "cca/cli/commands/config_args.hpp"
#include "cca/cli/formatter.hpp"

#include "cca/coordinator/coordinator.hpp"
#include "cca/report.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

namespace cca::cli
{
    namespace fs = std::filesystem;

    namespace {
        Result<std::string> read_source(const fs::path& path) {
            std::error_code ec;
            if (!fs::is_regular_file(path, ec)) {
                return Result<std::string>::failure(Error::not_found("No such file", path.string()));
            }

            std::ifstream in(path, std::ios::binary);
            if (!in) {
                return Result<std::string>::failure(Error::io_error("Cannot open file", path.string()));
            }
            std::ostringstream content;
            content << in.rdbuf();
            if (in.bad()) {
                return Result<std::string>::failure(Error::io_error("Failed to read file", path.string()));
            }
            return Result<std::string>::success(content.str());
        }
    }

    /**
     * Analyze command - submits source files to the coordinator.
     */
    class AnalyzeCommand : public Command {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "analyze";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Analyze source files for security, quality, performance and best-practice issues";
        }

        [[nodiscard]] std::string usage() const override {
            return Command::usage() + "\n"
                   "\n"
                   "Examples:\n"
                   "  cca analyze --store sqlite://cca.db app.py\n"
                   "  cca analyze --config cca.toml --policy best_effort src/*.py\n"
                   "  cca analyze --json --output report.json handlers.py";
        }

        [[nodiscard]] std::vector<ArgDef> arguments() const override {
            auto args = config_arguments();
            args.push_back({"output", 'o', "Also write the JSON report to this file", false, true, "", "FILE"});
            args.push_back({"top", 't', "Findings to show per category (0=all)", false, true, "10", "N"});
            args.push_back({"no-color", 0, "Disable colored output", false, false, "", ""});
            return args;
        }

        [[nodiscard]] std::vector<PositionalDef> positionals() const override {
            return {{"FILE", "Source file to analyze", true, true}};
        }

        [[nodiscard]] std::string validate(const ParsedArgs& args) const override {
            if (args.positional().empty()) {
                return "No source files specified. Use 'cca analyze <files...>'";
            }
            if (const auto top = args.get_int("top"); !top || *top < 0) {
                return "--top expects a non-negative integer";
            }
            return Command::validate(args);
        }

        [[nodiscard]] int execute(const ParsedArgs& args) override {
            apply_common_flags(args);
            if (args.get_flag("no-color")) {
                colors::set_enabled(false);
            }

            auto config = resolve_config(args);
            if (config.is_err()) {
                print_error(config.error().to_string());
                return 1;
            }
            init_logging(config.value(), args);

            auto engine = coordinator::Coordinator::create(std::move(config).value());
            if (engine.is_err()) {
                print_error(engine.error().to_string());
                return 1;
            }

            print_verbose(std::string("Execution mode: ") + to_string(engine.value()->mode()));

            const auto top = static_cast<std::size_t>(args.get_int("top").value_or(10));
            nlohmann::json reports = nlohmann::json::array();
            bool all_ok = true;

            for (const auto& file : args.positional()) {
                auto content = read_source(file);
                if (content.is_err()) {
                    print_error(content.error().to_string());
                    all_ok = false;
                    continue;
                }

                auto result = engine.value()->submit(content.value(), fs::path(file).filename().string());
                if (result.is_err()) {
                    print_error("Analysis of " + file + " failed: " + result.error().to_string());
                    all_ok = false;
                    continue;
                }

                reports.push_back(report::report_to_json(result.value()));

                if (is_json() || is_quiet()) {
                    continue;
                }

                SummaryPrinter printer(out());
                printer.print_report_summary(result.value());
                printer.print_failures(result.value());
                printer.print_findings(result.value(), top);
            }

            // A single file gives a single report object.
            const nlohmann::json document = reports.size() == 1 ? reports.front() : reports;

            if (is_json()) {
                out() << report::dump_json(document) << "\n";
            }

            if (auto output_file = args.get("output")) {
                std::ofstream output(*output_file);
                if (!output) {
                    print_error("Failed to open output file: " + *output_file);
                    return 1;
                }
                output << report::dump_json(document) << "\n";
                if (!is_json()) {
                    print("Report written to " + *output_file);
                }
            }

            return all_ok ? 0 : 1;
        }
    };

    namespace {
        struct AnalyzeCommandRegistrar {
            AnalyzeCommandRegistrar() {
                CommandRegistry::instance().register_command(
                    std::make_unique<AnalyzeCommand>()
                );
            }
        } analyze_registrar;
    }
}  // namespace cca::cli

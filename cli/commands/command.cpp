//
// Created by gregorian-rayne on 2/12/26.
//

#include "cca/cli/commands/command.hpp"
#include "cca/version.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <limits>
#include <sstream>
#include <unordered_map>

namespace cca::cli
{
    namespace {
        struct CommonFlag {
            char short_name;
            std::string_view name;
            std::string_view help;
        };

        constexpr std::array COMMON_FLAGS{
            CommonFlag{'h', "help", "Show this help message"},
            CommonFlag{'v', "verbose", "Enable verbose output"},
            CommonFlag{'q', "quiet", "Only show errors"},
            CommonFlag{0, "json", "Output in JSON format"},
        };

        const CommonFlag* common_flag(const std::string_view name) {
            const auto it = std::ranges::find(COMMON_FLAGS, name, &CommonFlag::name);
            return it == COMMON_FLAGS.end() ? nullptr : &*it;
        }

        const CommonFlag* common_flag(const char short_name) {
            const auto it = std::ranges::find(COMMON_FLAGS, short_name, &CommonFlag::short_name);
            return it == COMMON_FLAGS.end() || short_name == 0 ? nullptr : &*it;
        }

        std::string option_label(const char short_name, const std::string_view name) {
            std::string label = short_name ? std::string{'-', short_name, ',', ' '} : std::string(4, ' ');
            label += "--";
            label += name;
            return label;
        }

        /**
         * Walks the argument words once, filling a ParsedArgs. The first
         * error stops parsing.
         */
        class ArgumentParser {
        public:
            ArgumentParser(const std::vector<std::string>& words, const std::vector<ArgDef>& defs)
                : words_(words) {
                for (const auto& def : defs) {
                    by_name_[def.name] = &def;
                    if (def.short_name) {
                        by_short_[def.short_name] = &def;
                    }
                    if (!def.default_value.empty()) {
                        result_.args.set(def.name, def.default_value);
                    }
                }
            }

            ParseResult run() && {
                bool operands_only = false;
                for (pos_ = 0; pos_ < words_.size() && result_.success; ++pos_) {
                    const std::string& word = words_[pos_];
                    if (word.empty()) {
                        continue;
                    }
                    if (operands_only || word == "-" || word[0] != '-') {
                        result_.args.add_positional(word);
                    } else if (word == "--") {
                        operands_only = true;
                    } else if (word[1] == '-') {
                        take_long(std::string_view(word).substr(2));
                    } else {
                        take_short_cluster(std::string_view(word).substr(1));
                    }
                }
                return std::move(result_);
            }

        private:
            void take_long(const std::string_view body) {
                const auto eq = body.find('=');
                const std::string name(body.substr(0, eq));
                const bool inline_value = eq != std::string_view::npos;

                const auto it = by_name_.find(name);
                if (it == by_name_.end()) {
                    if (common_flag(name) && !inline_value) {
                        result_.args.set_flag(name);
                    } else {
                        fail("Unknown option: --" + name);
                    }
                    return;
                }

                if (!it->second->takes_value) {
                    if (inline_value) {
                        fail("Option --" + name + " does not take a value");
                    } else {
                        result_.args.set_flag(name);
                    }
                    return;
                }

                const std::string value = inline_value ? std::string(body.substr(eq + 1)) : next_word();
                if (value.empty()) {
                    fail("Option --" + name + " requires a value");
                    return;
                }
                result_.args.set(name, value);
            }

            void take_short_cluster(const std::string_view cluster) {
                for (std::size_t i = 0; i < cluster.size(); ++i) {
                    const char c = cluster[i];
                    if (const auto* flag = common_flag(c)) {
                        result_.args.set_flag(std::string(flag->name));
                        continue;
                    }

                    const auto it = by_short_.find(c);
                    if (it == by_short_.end()) {
                        fail(std::string("Unknown option: -") + c);
                        return;
                    }
                    const ArgDef& def = *it->second;
                    if (!def.takes_value) {
                        result_.args.set_flag(def.name);
                        continue;
                    }

                    // The rest of the cluster, or the next word, is the value.
                    const std::string value = i + 1 < cluster.size()
                        ? std::string(cluster.substr(i + 1))
                        : next_word();
                    if (value.empty()) {
                        fail(std::string("Option -") + c + " requires a value");
                    } else {
                        result_.args.set(def.name, value);
                    }
                    return;
                }
            }

            std::string next_word() {
                return pos_ + 1 < words_.size() ? words_[++pos_] : std::string{};
            }

            void fail(std::string message) {
                result_.error = std::move(message);
                result_.success = false;
            }

            const std::vector<std::string>& words_;
            std::unordered_map<std::string, const ArgDef*> by_name_;
            std::unordered_map<char, const ArgDef*> by_short_;
            ParseResult result_;
            std::size_t pos_ = 0;
        };
    }

    std::optional<std::int64_t> parse_int64(const std::string_view text) noexcept {
        std::int64_t value = 0;
        const char* last = text.data() + text.size();
        if (const auto [ptr, ec] = std::from_chars(text.data(), last, value);
            text.empty() || ec != std::errc{} || ptr != last) {
            return std::nullopt;
        }
        return value;
    }

    std::optional<std::string> ParsedArgs::get(const std::string& name) const {
        const auto it = values_.find(name);
        return it == values_.end() ? std::nullopt : std::optional<std::string>(it->second);
    }

    std::string ParsedArgs::get_or(const std::string& name, const std::string& fallback) const {
        return get(name).value_or(fallback);
    }

    std::optional<std::int64_t> ParsedArgs::get_int64(const std::string& name) const {
        const auto text = get(name);
        return text ? parse_int64(*text) : std::nullopt;
    }

    std::optional<int> ParsedArgs::get_int(const std::string& name) const {
        const auto wide = get_int64(name);
        if (!wide || *wide < std::numeric_limits<int>::min() || *wide > std::numeric_limits<int>::max()) {
            return std::nullopt;
        }
        return static_cast<int>(*wide);
    }

    ParseResult parse_arguments(const std::vector<std::string>& args, const std::vector<ArgDef>& defs) {
        return ArgumentParser(args, defs).run();
    }

    Command::Command()
        : out_(&std::cout)
        , err_(&std::cerr)
    {}

    void Command::set_streams(std::ostream& out, std::ostream& err) {
        out_ = &out;
        err_ = &err;
    }

    std::string Command::usage() const {
        std::ostringstream line;
        line << "Usage: " << PROJECT_SHORT_NAME << " " << name();
        for (const auto& def : arguments()) {
            if (def.required) {
                line << " --" << def.name << " <" << def.value_name << ">";
            }
        }
        line << " [OPTIONS]";
        for (const auto& operand : positionals()) {
            line << (operand.required ? " <" : " [") << operand.value_name
                 << (operand.variadic ? "..." : "") << (operand.required ? ">" : "]");
        }
        return line.str();
    }

    std::string Command::validate(const ParsedArgs& args) const {
        for (const auto& def : arguments()) {
            if (def.required && !args.has(def.name)) {
                return "Missing required argument: --" + def.name;
            }
        }

        const auto operands = positionals();
        const auto required = static_cast<std::size_t>(
            std::ranges::count_if(operands, &PositionalDef::required));
        const bool variadic = std::ranges::any_of(operands, &PositionalDef::variadic);
        const auto& given = args.positional();

        if (given.size() < required) {
            return "Missing <" + operands[given.size()].value_name + ">. " + usage();
        }
        if (!variadic && given.size() > operands.size()) {
            return "Unexpected argument: " + given[operands.size()];
        }
        return "";
    }

    void Command::print_help() const {
        auto& os = out();
        os << description() << "\n\n" << usage() << "\n\n";

        if (const auto operands = positionals(); !operands.empty()) {
            os << "Arguments:\n";
            for (const auto& operand : operands) {
                os << "  " << std::left << std::setw(26) << operand.value_name << operand.description << "\n";
            }
            os << "\n";
        }

        if (const auto defs = arguments(); !defs.empty()) {
            os << "Options:\n";
            for (const auto& def : defs) {
                os << "  " << std::left << std::setw(26) << option_label(def.short_name, def.name)
                   << def.description;
                if (!def.default_value.empty()) {
                    os << " (default: " << def.default_value << ")";
                }
                os << (def.required ? " [required]\n" : "\n");
            }
            os << "\n";
        }

        os << "Common options:\n";
        for (const auto& flag : COMMON_FLAGS) {
            os << "  " << std::left << std::setw(26) << option_label(flag.short_name, flag.name)
               << flag.help << "\n";
        }
    }

    void Command::apply_common_flags(const ParsedArgs& args) {
        verbose_ = args.get_flag("verbose");
        quiet_ = !verbose_ && args.get_flag("quiet");
        json_ = args.get_flag("json");
    }

    void Command::print(const std::string_view msg) const {
        if (!quiet_) {
            *out_ << msg << "\n";
        }
    }

    void Command::print_verbose(const std::string_view msg) const {
        if (verbose_) {
            *out_ << msg << "\n";
        }
    }

    void Command::print_error(const std::string_view msg) const {
        *err_ << "error: " << msg << "\n";
    }

    CommandRegistry& CommandRegistry::instance() {
        static CommandRegistry registry;
        return registry;
    }

    void CommandRegistry::register_command(std::unique_ptr<Command> cmd) {
        commands_.push_back(std::move(cmd));
    }

    Command* CommandRegistry::find(const std::string_view name) const {
        const auto it = std::ranges::find_if(commands_, [name](const auto& cmd) { return cmd->name() == name; });
        return it == commands_.end() ? nullptr : it->get();
    }

    std::vector<Command*> CommandRegistry::list() const {
        std::vector<Command*> commands;
        commands.reserve(commands_.size());
        std::ranges::transform(commands_, std::back_inserter(commands), [](const auto& cmd) { return cmd.get(); });
        return commands;
    }

    int run_command(Command& command, const std::vector<std::string>& args) {
        const auto parsed = parse_arguments(args, command.arguments());
        if (!parsed.success) {
            command.print_error(parsed.error + "\nRun '" + PROJECT_SHORT_NAME + " " +
                                std::string(command.name()) + " --help' for usage.");
            return 2;
        }

        if (parsed.args.get_flag("help")) {
            command.print_help();
            return 0;
        }

        if (const auto problem = command.validate(parsed.args); !problem.empty()) {
            command.print_error(problem);
            return 2;
        }

        return command.execute(parsed.args);
    }

}  // namespace cca::cli

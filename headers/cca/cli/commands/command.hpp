//
// Created by gregorian-rayne on 2/12/26.
//

#ifndef CCA_COMMAND_HPP
#define CCA_COMMAND_HPP

/**
 * @file command.hpp
 * @brief Subcommand base class, option parser and registry for `cca`.
 *
 * `cca analyze`, `cca report`, `cca history` and `cca status` each live in
 * their own file under cli/commands and add themselves to CommandRegistry
 * from a static registrar. A command only declares its options and operands;
 * parsing, validation, help output and the shared -h/-v/-q/--json flags are
 * handled here.
 */

#include <cstdint>
#include <iosfwd>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace cca::cli
{
    /// A named option. Options without a value are flags.
    struct ArgDef {
        std::string name;
        char short_name = 0;
        std::string description;
        bool required = false;
        bool takes_value = true;
        std::string default_value;
        std::string value_name = "VALUE";
    };

    /// An operand such as <FILE> or [ID].
    struct PositionalDef {
        std::string value_name;
        std::string description;
        bool required = true;
        bool variadic = false;
    };

    /// Whole-string decimal integer, or nullopt on junk or overflow.
    [[nodiscard]] std::optional<std::int64_t> parse_int64(std::string_view text) noexcept;

    class ParsedArgs {
    public:
        void set(const std::string& name, const std::string& value) { values_[name] = value; }
        void set_flag(const std::string& name) { flags_.insert(name); }
        void add_positional(const std::string& value) { positional_.push_back(value); }

        [[nodiscard]] bool has(const std::string& name) const {
            return values_.contains(name) || flags_.contains(name);
        }

        [[nodiscard]] std::optional<std::string> get(const std::string& name) const;
        [[nodiscard]] std::string get_or(const std::string& name, const std::string& fallback) const;
        [[nodiscard]] std::optional<int> get_int(const std::string& name) const;
        [[nodiscard]] std::optional<std::int64_t> get_int64(const std::string& name) const;
        [[nodiscard]] bool get_flag(const std::string& name) const { return flags_.contains(name); }

        [[nodiscard]] const std::vector<std::string>& positional() const { return positional_; }

    private:
        std::map<std::string, std::string> values_;
        std::set<std::string> flags_;
        std::vector<std::string> positional_;
    };

    struct ParseResult {
        ParsedArgs args;
        std::string error;
        bool success = true;
    };

    /**
     * Parses the words after the command name against @p defs. Accepts
     * --name value, --name=value, -n value, -nvalue and clustered short
     * flags. "--" ends option parsing and a lone "-" is an operand.
     * Declared defaults are filled in before parsing.
     */
    [[nodiscard]] ParseResult parse_arguments(const std::vector<std::string>& args,
                                              const std::vector<ArgDef>& defs);

    class Command {
    public:
        Command();
        virtual ~Command() = default;

        [[nodiscard]] virtual std::string_view name() const noexcept = 0;
        [[nodiscard]] virtual std::string_view description() const noexcept = 0;

        [[nodiscard]] virtual std::vector<ArgDef> arguments() const { return {}; }
        [[nodiscard]] virtual std::vector<PositionalDef> positionals() const { return {}; }

        /// "Usage: cca <name> --required <V> [OPTIONS] <OPERAND...>"
        [[nodiscard]] virtual std::string usage() const;

        /**
         * Checks required options and the operand count.
         *
         * @return Empty when the arguments are usable, otherwise the message.
         */
        [[nodiscard]] virtual std::string validate(const ParsedArgs& args) const;

        /// @return Process exit code.
        [[nodiscard]] virtual int execute(const ParsedArgs& args) = 0;

        void print_help() const;
        void print_error(std::string_view msg) const;

        /// Replaces std::cout and std::cerr, mainly for tests.
        void set_streams(std::ostream& out, std::ostream& err);

    protected:
        /// Reads -v, -q and --json into the output mode.
        void apply_common_flags(const ParsedArgs& args);

        void print(std::string_view msg) const;
        void print_verbose(std::string_view msg) const;

        [[nodiscard]] std::ostream& out() const { return *out_; }

        [[nodiscard]] bool is_quiet() const { return quiet_; }
        [[nodiscard]] bool is_json() const { return json_; }

    private:
        std::ostream* out_;
        std::ostream* err_;
        bool quiet_ = false;
        bool verbose_ = false;
        bool json_ = false;
    };

    class CommandRegistry {
    public:
        static CommandRegistry& instance();

        void register_command(std::unique_ptr<Command> cmd);

        [[nodiscard]] Command* find(std::string_view name) const;

        /// Commands in registration order.
        [[nodiscard]] std::vector<Command*> list() const;

    private:
        CommandRegistry() = default;
        std::vector<std::unique_ptr<Command>> commands_;
    };

    /**
     * Parses, validates and executes @p command. --help prints the help
     * text instead of executing.
     *
     * @return The command's exit code, or 2 for a usage error.
     */
    [[nodiscard]] int run_command(Command& command, const std::vector<std::string>& args);

}  // namespace cca::cli

#endif //CCA_COMMAND_HPP

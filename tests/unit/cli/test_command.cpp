//
// Created by gregorian-rayne on 2/12/26.
//

#include "cca/cli/commands/command.hpp"
#include "cca/cli/commands/config_args.hpp"
#include "cca/logging.hpp"

#include <gtest/gtest.h>

#include <map>
#include <sstream>

namespace cca::cli
{
    namespace {

        class EchoCommand final : public Command {
        public:
            [[nodiscard]] std::string_view name() const noexcept override { return "echo"; }
            [[nodiscard]] std::string_view description() const noexcept override { return "Echo operands"; }

            [[nodiscard]] std::vector<ArgDef> arguments() const override {
                return {
                    {"output", 'o', "Output file", false, true, "", "FILE"},
                    {"top", 't', "Findings per category", false, true, "10", "N"},
                    {"no-color", 0, "Disable colors", false, false},
                    {"tag", 0, "Required tag", required_tag, true, "", "TAG"},
                };
            }

            [[nodiscard]] std::vector<PositionalDef> positionals() const override {
                return {{"FILE", "Files to echo", true, variadic}};
            }

            [[nodiscard]] int execute(const ParsedArgs& args) override {
                apply_common_flags(args);
                ++executions;
                for (const auto& file : args.positional()) {
                    print(file);
                }
                print_verbose("done");
                return 7;
            }

            bool required_tag = false;
            bool variadic = true;
            int executions = 0;
        };

        ParseResult parse(const std::vector<std::string>& argv) {
            return parse_arguments(argv, EchoCommand{}.arguments());
        }

        EnvironmentLookup fake_environment(std::map<std::string, std::string> values) {
            return [values = std::move(values)](const std::string& name) -> std::optional<std::string> {
                if (const auto it = values.find(name); it != values.end()) {
                    return it->second;
                }
                return std::nullopt;
            };
        }

        ParsedArgs parse_config(const std::vector<std::string>& argv) {
            auto result = parse_arguments(argv, config_arguments());
            EXPECT_TRUE(result.success) << result.error;
            return result.args;
        }

    }  // namespace

    TEST(ParseInt64Test, AcceptsWholeDecimal) {
        EXPECT_EQ(parse_int64("42"), 42);
        EXPECT_EQ(parse_int64("-3"), -3);
        EXPECT_FALSE(parse_int64("").has_value());
        EXPECT_FALSE(parse_int64("12abc").has_value());
        EXPECT_FALSE(parse_int64(" 1").has_value());
        EXPECT_FALSE(parse_int64("99999999999999999999").has_value());
    }

    TEST(ParseArgumentsTest, DefaultsArePrePopulated) {
        const auto result = parse({"a.py"});

        ASSERT_TRUE(result.success);
        EXPECT_EQ(result.args.get_int("top"), 10);
        EXPECT_FALSE(result.args.has("output"));
        ASSERT_EQ(result.args.positional().size(), 1u);
    }

    TEST(ParseArgumentsTest, LongOptionForms) {
        const auto result = parse({"--output", "out.json", "--top=3", "--no-color", "a.py"});

        ASSERT_TRUE(result.success) << result.error;
        EXPECT_EQ(result.args.get("output"), "out.json");
        EXPECT_EQ(result.args.get_int("top"), 3);
        EXPECT_TRUE(result.args.get_flag("no-color"));
        EXPECT_EQ(result.args.positional()[0], "a.py");
    }

    TEST(ParseArgumentsTest, ShortOptionForms) {
        const auto result = parse({"-t5", "-o", "x.json", "-vq"});

        ASSERT_TRUE(result.success) << result.error;
        EXPECT_EQ(result.args.get_int("top"), 5);
        EXPECT_EQ(result.args.get("output"), "x.json");
        EXPECT_TRUE(result.args.get_flag("verbose"));
        EXPECT_TRUE(result.args.get_flag("quiet"));
    }

    TEST(ParseArgumentsTest, CommonFlags) {
        const auto result = parse({"--json", "--help"});

        ASSERT_TRUE(result.success);
        EXPECT_TRUE(result.args.get_flag("json"));
        EXPECT_TRUE(result.args.get_flag("help"));
    }

    TEST(ParseArgumentsTest, TerminatorAndDash) {
        const auto result = parse({"-", "--", "--not-an-option"});

        ASSERT_TRUE(result.success);
        ASSERT_EQ(result.args.positional().size(), 2u);
        EXPECT_EQ(result.args.positional()[0], "-");
        EXPECT_EQ(result.args.positional()[1], "--not-an-option");
    }

    TEST(ParseArgumentsTest, Errors) {
        EXPECT_FALSE(parse({"--bogus"}).success);
        EXPECT_FALSE(parse({"-x"}).success);
        EXPECT_FALSE(parse({"--output"}).success);
        EXPECT_FALSE(parse({"--no-color=yes"}).success);
        EXPECT_FALSE(parse({"--json=1"}).success);

        const auto missing = parse({"-o"});
        ASSERT_FALSE(missing.success);
        EXPECT_NE(missing.error.find("-o"), std::string::npos);
    }

    TEST(ParsedArgsTest, IntegerAccessors) {
        ParsedArgs args;
        args.set("n", "12");
        args.set("bad", "1.5");
        args.set("big", "9000000000");

        EXPECT_EQ(args.get_int("n"), 12);
        EXPECT_FALSE(args.get_int("bad").has_value());
        EXPECT_FALSE(args.get_int("big").has_value());
        EXPECT_EQ(args.get_int64("big"), 9000000000LL);
        EXPECT_FALSE(args.get_int("missing").has_value());
        EXPECT_EQ(args.get_or("missing", "x"), "x");
    }

    TEST(CommandTest, UsageLine) {
        EchoCommand command;
        command.required_tag = true;

        EXPECT_EQ(command.usage(), "Usage: cca echo --tag <TAG> [OPTIONS] <FILE...>");
    }

    TEST(CommandTest, ValidatePositionals) {
        EchoCommand command;
        command.variadic = false;

        ParsedArgs none;
        EXPECT_NE(command.validate(none).find("Missing <FILE>"), std::string::npos);

        ParsedArgs two;
        two.add_positional("a.py");
        two.add_positional("b.py");
        EXPECT_EQ(command.validate(two), "Unexpected argument: b.py");

        command.variadic = true;
        EXPECT_EQ(command.validate(two), "");
    }

    TEST(CommandTest, ValidateRequiredOption) {
        EchoCommand command;
        command.required_tag = true;

        ParsedArgs args;
        args.add_positional("a.py");
        EXPECT_EQ(command.validate(args), "Missing required argument: --tag");

        args.set("tag", "nightly");
        EXPECT_EQ(command.validate(args), "");
    }

    TEST(CommandTest, HelpListsOperandsAndDefaults) {
        EchoCommand command;
        std::ostringstream out;
        std::ostringstream err;
        command.set_streams(out, err);

        command.print_help();

        const auto text = out.str();
        EXPECT_NE(text.find("Echo operands"), std::string::npos);
        EXPECT_NE(text.find("Arguments:"), std::string::npos);
        EXPECT_NE(text.find("(default: 10)"), std::string::npos);
        EXPECT_NE(text.find("--verbose"), std::string::npos);
    }

    TEST(RunCommandTest, ExecutesWithStreams) {
        EchoCommand command;
        std::ostringstream out;
        std::ostringstream err;
        command.set_streams(out, err);

        EXPECT_EQ(run_command(command, {"-v", "a.py", "b.py"}), 7);
        EXPECT_EQ(command.executions, 1);
        EXPECT_EQ(out.str(), "a.py\nb.py\ndone\n");
    }

    TEST(RunCommandTest, UsageErrorsReturnTwo) {
        EchoCommand command;
        std::ostringstream out;
        std::ostringstream err;
        command.set_streams(out, err);

        EXPECT_EQ(run_command(command, {"--bogus", "a.py"}), 2);
        EXPECT_EQ(run_command(command, {}), 2);
        EXPECT_EQ(command.executions, 0);
    }

    TEST(RunCommandTest, HelpSkipsExecution) {
        EchoCommand command;
        std::ostringstream out;
        std::ostringstream err;
        command.set_streams(out, err);

        EXPECT_EQ(run_command(command, {"--help"}), 0);
        EXPECT_EQ(command.executions, 0);
        EXPECT_NE(out.str().find("Usage:"), std::string::npos);
    }

    TEST(ResolveConfigTest, FlagsOverrideEnvironment) {
        const auto args = parse_config({"--store", "sqlite:///flag.db", "--security-fork", "sqlite:///s.db",
                                        "--quality-fork=sqlite:///q.db", "-p", "best_effort"});

        auto config = resolve_config(args, fake_environment({
            {"DATABASE_URL", "sqlite:///env.db"},
            {"CCA_FAILURE_POLICY", "all_or_nothing"},
        }));

        ASSERT_TRUE(config.is_ok()) << config.error().to_string();
        EXPECT_EQ(config.value().primary_store_url, "sqlite:///flag.db");
        EXPECT_EQ(config.value().failure_policy, FailurePolicy::BestEffort);
        EXPECT_EQ(config.value().execution_mode(), ExecutionMode::Forked);
    }

    TEST(ResolveConfigTest, EnvironmentOnly) {
        auto config = resolve_config(parse_config({}), fake_environment({
            {"DATABASE_URL", "sqlite:///env.db"},
            {"SECURITY_FORK_URL", "sqlite:///s.db"},
        }));

        ASSERT_TRUE(config.is_ok());
        EXPECT_EQ(config.value().primary_store_url, "sqlite:///env.db");
        EXPECT_EQ(config.value().execution_mode(), ExecutionMode::Sequential);
    }

    TEST(ResolveConfigTest, MissingPrimaryStore) {
        auto config = resolve_config(parse_config({}), fake_environment({}));

        ASSERT_TRUE(config.is_err());
        EXPECT_EQ(config.error().code(), ErrorCode::ConfigError);
    }

    TEST(ResolveConfigTest, UnknownPolicyFlag) {
        auto config = resolve_config(parse_config({"--store", ":memory:", "--policy", "sometimes"}),
                                     fake_environment({}));

        ASSERT_TRUE(config.is_err());
        EXPECT_EQ(config.error().code(), ErrorCode::ConfigError);
        EXPECT_EQ(config.error().context().value_or(""), "--policy");
    }

    TEST(ResolveConfigTest, MissingConfigFile) {
        auto config = resolve_config(parse_config({"--config", "/nonexistent/cca.toml"}), fake_environment({}));

        ASSERT_TRUE(config.is_err());
        EXPECT_EQ(config.error().code(), ErrorCode::ConfigError);
    }

    TEST(ResolveConfigTest, InvalidLogLevel) {
        auto config = resolve_config(parse_config({"--store", ":memory:", "--log-level", "loud"}),
                                     fake_environment({}));

        ASSERT_TRUE(config.is_err());
        EXPECT_EQ(config.error().code(), ErrorCode::ConfigError);
    }

    TEST(InitLoggingTest, VerboseRaisesLevelToDebug) {
        CoordinatorConfig config;
        config.logging.level = "warn";

        init_logging(config, ParsedArgs{});
        EXPECT_EQ(logging::get_logger()->level(), spdlog::level::warn);

        ParsedArgs verbose;
        verbose.set_flag("verbose");
        init_logging(config, verbose);
        EXPECT_EQ(logging::get_logger()->level(), spdlog::level::debug);

        verbose.set("log-level", "warn");
        init_logging(config, verbose);
        EXPECT_EQ(logging::get_logger()->level(), spdlog::level::warn);
    }

    TEST(InitLoggingTest, SetLevelFallsBackToInfo) {
        logging::init("error");

        logging::set_level("trace");
        EXPECT_EQ(logging::get_logger()->level(), spdlog::level::trace);

        logging::set_level("loud");
        EXPECT_EQ(logging::get_logger()->level(), spdlog::level::info);
    }
}

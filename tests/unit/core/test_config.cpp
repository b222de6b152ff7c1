//
// Created by gregorian-rayne on 2/10/26.
//

#include "cca/config.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <map>

namespace fs = std::filesystem;

namespace cca
{
    namespace {
        EnvironmentLookup fake_environment(std::map<std::string, std::string> vars) {
            return [vars = std::move(vars)](const std::string& name) -> std::optional<std::string> {
                if (const auto it = vars.find(name); it != vars.end()) {
                    return it->second;
                }
                return std::nullopt;
            };
        }
    }

    class ConfigTest : public ::testing::Test {
    protected:
        void SetUp() override {
            temp_dir = fs::temp_directory_path() / "cca_config_test";
            fs::create_directories(temp_dir);
        }

        void TearDown() override {
            std::error_code ec;
            fs::remove_all(temp_dir, ec);
        }

        std::string create_test_file(const std::string& filename, const std::string& content) const {
            const fs::path file_path = temp_dir / filename;
            std::ofstream file(file_path);
            file << content;
            return file_path.string();
        }

        fs::path temp_dir;
    };

    TEST_F(ConfigTest, DefaultsAreSequentialAllOrNothing) {
        const CoordinatorConfig config;

        EXPECT_TRUE(config.primary_store_url.empty());
        EXPECT_EQ(config.failure_policy, FailurePolicy::AllOrNothing);
        EXPECT_EQ(config.execution_mode(), ExecutionMode::Sequential);
        EXPECT_EQ(config.logging.level, "info");
    }

    TEST_F(ConfigTest, ValidateRejectsMissingPrimary) {
        const CoordinatorConfig config;
        const auto result = config.validate();

        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::ConfigError);
    }

    TEST_F(ConfigTest, ValidateRejectsUnsupportedScheme) {
        CoordinatorConfig config;
        config.primary_store_url = "postgresql://db.internal/cca";

        const auto result = config.validate();
        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::ConfigError);
    }

    TEST_F(ConfigTest, ValidateRejectsBadForkScheme) {
        CoordinatorConfig config;
        config.primary_store_url = "sqlite::memory:";
        config.set_fork(Category::Quality, "redis://cache");

        const auto result = config.validate();
        ASSERT_TRUE(result.is_err());
        EXPECT_NE(result.error().to_string().find("quality fork"), std::string::npos);
    }

    TEST_F(ConfigTest, ValidateRejectsUnknownLogLevel) {
        CoordinatorConfig config;
        config.primary_store_url = "main.db";
        config.logging.level = "chatty";

        EXPECT_TRUE(config.validate().is_err());
    }

    TEST_F(ConfigTest, ForkedModeNeedsSecurityAndQuality) {
        CoordinatorConfig config;
        config.primary_store_url = "sqlite://main.db";

        config.set_fork(Category::Security, "sqlite://security.db");
        EXPECT_EQ(config.execution_mode(), ExecutionMode::Sequential);

        config.set_fork(Category::Performance, "sqlite://performance.db");
        EXPECT_EQ(config.execution_mode(), ExecutionMode::Sequential);

        config.set_fork(Category::Quality, "sqlite://quality.db");
        EXPECT_EQ(config.execution_mode(), ExecutionMode::Forked);
    }

    TEST_F(ConfigTest, StoreUrlFallsBackToPrimary) {
        CoordinatorConfig config;
        config.primary_store_url = "sqlite://main.db";
        config.set_fork(Category::Security, "sqlite://security.db");

        EXPECT_EQ(config.store_url_for(Category::Security), "sqlite://security.db");
        EXPECT_EQ(config.store_url_for(Category::BestPractices), "sqlite://main.db");

        config.set_fork(Category::Security, "");
        EXPECT_FALSE(config.has_fork(Category::Security));
        EXPECT_EQ(config.store_url_for(Category::Security), "sqlite://main.db");
    }

    TEST_F(ConfigTest, LoadFromString) {
        const auto result = load_config_from_string(R"(
[store]
primary = "sqlite:///var/lib/cca/main.db"

[store.forks]
security = "sqlite:///var/lib/cca/security.db"
quality = "sqlite:///var/lib/cca/quality.db"
best_practices = "sqlite:///var/lib/cca/bp.db"

[analysis]
failure_policy = "best_effort"

[logging]
level = "debug"
file = "/tmp/cca.log"
)");

        ASSERT_TRUE(result.is_ok()) << result.error().to_string();
        const auto& config = result.value();
        EXPECT_EQ(config.primary_store_url, "sqlite:///var/lib/cca/main.db");
        EXPECT_EQ(config.store_url_for(Category::Security), "sqlite:///var/lib/cca/security.db");
        EXPECT_EQ(config.store_url_for(Category::BestPractices), "sqlite:///var/lib/cca/bp.db");
        EXPECT_FALSE(config.has_fork(Category::Performance));
        EXPECT_EQ(config.failure_policy, FailurePolicy::BestEffort);
        EXPECT_EQ(config.execution_mode(), ExecutionMode::Forked);
        EXPECT_EQ(config.logging.level, "debug");
        EXPECT_EQ(config.logging.file, "/tmp/cca.log");
        EXPECT_EQ(config.logging.pattern, logging::DEFAULT_PATTERN);
    }

    TEST_F(ConfigTest, LoadFromEmptyStringGivesDefaults) {
        const auto result = load_config_from_string("");

        ASSERT_TRUE(result.is_ok());
        EXPECT_TRUE(result.value().primary_store_url.empty());
    }

    TEST_F(ConfigTest, MalformedTomlIsConfigError) {
        const auto result = load_config_from_string("[store\nprimary = ");

        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::ConfigError);
    }

    TEST_F(ConfigTest, WrongValueTypeIsConfigError) {
        const auto result = load_config_from_string("[store]\nprimary = 42\n");

        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().context().value(), "store.primary");
    }

    TEST_F(ConfigTest, UnknownPolicyIsConfigError) {
        const auto result = load_config_from_string("[analysis]\nfailure_policy = \"retry\"\n");

        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::ConfigError);
    }

    TEST_F(ConfigTest, LoadFromFile) {
        const auto path = create_test_file("cca.toml", "[store]\nprimary = \"main.db\"\n");
        const auto result = load_config_from_file(path);

        ASSERT_TRUE(result.is_ok());
        EXPECT_EQ(result.value().primary_store_url, "main.db");
    }

    TEST_F(ConfigTest, MissingFileIsConfigError) {
        const auto result = load_config_from_file((temp_dir / "absent.toml").string());

        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::ConfigError);
    }

    TEST_F(ConfigTest, EnvironmentOverlay) {
        CoordinatorConfig config;
        config.primary_store_url = "from-file.db";

        const auto env = fake_environment({
            {"DATABASE_URL", "sqlite://env.db"},
            {"SECURITY_FORK_URL", "sqlite://sec.db"},
            {"QUALITY_FORK_URL", "sqlite://qual.db"},
            {"PERFORMANCE_FORK_URL", ""},
            {"CCA_FAILURE_POLICY", "best_effort"},
        });

        ASSERT_TRUE(apply_environment(config, env).is_ok());
        EXPECT_EQ(config.primary_store_url, "sqlite://env.db");
        EXPECT_TRUE(config.has_fork(Category::Security));
        EXPECT_TRUE(config.has_fork(Category::Quality));
        EXPECT_FALSE(config.has_fork(Category::Performance));
        EXPECT_EQ(config.failure_policy, FailurePolicy::BestEffort);
        EXPECT_EQ(config.execution_mode(), ExecutionMode::Forked);
    }

    TEST_F(ConfigTest, EmptyEnvironmentLeavesConfigAlone) {
        CoordinatorConfig config;
        config.primary_store_url = "keep.db";

        ASSERT_TRUE(apply_environment(config, fake_environment({{"DATABASE_URL", ""}})).is_ok());
        EXPECT_EQ(config.primary_store_url, "keep.db");
    }

    TEST_F(ConfigTest, BadEnvironmentPolicy) {
        CoordinatorConfig config;
        const auto result = apply_environment(config, fake_environment({{"CCA_FAILURE_POLICY", "sometimes"}}));

        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().context().value(), "CCA_FAILURE_POLICY");
    }

    TEST_F(ConfigTest, ConfigFromEnvironmentOnly) {
        const auto result = config_from_environment(fake_environment({{"DATABASE_URL", "sqlite::memory:"}}));

        ASSERT_TRUE(result.is_ok());
        EXPECT_EQ(result.value().primary_store_url, "sqlite::memory:");
        EXPECT_TRUE(result.value().validate().is_ok());
    }

    TEST_F(ConfigTest, ForkVariableNames) {
        EXPECT_STREQ(fork_environment_variable(Category::Security), "SECURITY_FORK_URL");
        EXPECT_STREQ(fork_environment_variable(Category::BestPractices), "BEST_PRACTICES_FORK_URL");
    }
}

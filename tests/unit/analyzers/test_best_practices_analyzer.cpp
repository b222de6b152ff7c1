//
// Created by gregorian-rayne on 2/11/26.
//

#include "cca/analyzers/best_practices_analyzer.hpp"

#include <gtest/gtest.h>

namespace cca::analyzers {

    class BestPracticesAnalyzerTest : public ::testing::Test {
    protected:
        void SetUp() override {
            analyzer_ = std::make_unique<BestPracticesAnalyzer>(nullptr);
        }

        std::vector<Finding> run(const std::string_view text, const std::string_view filename = "main.py") const {
            auto result = analyzer_->analyze(text, filename);
            EXPECT_TRUE(result.is_ok());
            return result.is_ok() ? result.value() : std::vector<Finding>{};
        }

        /// Runs a single line and expects exactly one finding with the given issue.
        void expect_single(const std::string_view line, const std::string& issue, const Severity severity) const {
            const auto findings = run(line);
            ASSERT_EQ(findings.size(), 1u) << line;
            EXPECT_EQ(findings[0].issue, issue);
            EXPECT_EQ(findings[0].severity, severity);
            EXPECT_EQ(findings[0].category, Category::BestPractices);
        }

        std::unique_ptr<BestPracticesAnalyzer> analyzer_;
    };

    TEST_F(BestPracticesAnalyzerTest, Name) {
        EXPECT_EQ(analyzer_->name(), "BestPracticesAnalyzer");
        EXPECT_EQ(analyzer_->category(), Category::BestPractices);
    }

    TEST_F(BestPracticesAnalyzerTest, DetectLanguage) {
        EXPECT_EQ(BestPracticesAnalyzer::detect_language("app.py"), Language::Python);
        EXPECT_EQ(BestPracticesAnalyzer::detect_language("APP.PY"), Language::Python);
        EXPECT_EQ(BestPracticesAnalyzer::detect_language("py"), Language::Python);
        EXPECT_EQ(BestPracticesAnalyzer::detect_language("index.ts"), Language::TypeScript);
        EXPECT_EQ(BestPracticesAnalyzer::detect_language("main.cpp"), Language::Cpp);
        EXPECT_EQ(BestPracticesAnalyzer::detect_language("Makefile"), Language::Unknown);
        EXPECT_EQ(BestPracticesAnalyzer::detect_language("bundle.tar.gz"), Language::Unknown);
        EXPECT_STREQ(to_string(Language::JavaScript), "javascript");
    }

    TEST_F(BestPracticesAnalyzerTest, BareExcept) {
        const auto findings = run("try:\n    run()\nexcept:\n    log_failure()\n");

        ASSERT_EQ(findings.size(), 1u);
        EXPECT_EQ(findings[0].issue, "Bare except clause catches all exceptions");
        EXPECT_EQ(findings[0].severity, Severity::Medium);
        EXPECT_EQ(findings[0].line, 3u);
        EXPECT_EQ(findings[0].snippet, "except:");
    }

    TEST_F(BestPracticesAnalyzerTest, PythonRulesNeedPythonFile) {
        EXPECT_TRUE(run("except:\n", "handler.js").empty());
        EXPECT_TRUE(run("print(x)\n", "notes.txt").empty());
    }

    TEST_F(BestPracticesAnalyzerTest, PythonLineRules) {
        expect_single("print(total)", "Print statement in production code", Severity::Low);
        expect_single("def f(items=[]):", "Mutable default argument", Severity::High);
        expect_single("square = lambda x: x * x", "Lambda assignment should be a function", Severity::Medium);
        expect_single("if type(x) == int:", "Using type() for type checking", Severity::Medium);
        expect_single("if flag == True:", "Explicit boolean comparison", Severity::Low);
        expect_single("if len(items) > 0:", "Using len() in conditional", Severity::Low);
        expect_single("from os import *", "Wildcard import", Severity::Medium);
        expect_single("x = 1; y = 2", "Multiple statements on one line", Severity::Low);
    }

    TEST_F(BestPracticesAnalyzerTest, PrintAllowedWithMainGuardOrDebug) {
        EXPECT_TRUE(run("print(x)\nif __name__ == \"__main__\":\n    main()\n").empty());
        EXPECT_TRUE(run("print(\"debug:\", x)\n").empty());
        EXPECT_TRUE(run("# print(x)\n").empty());
    }

    TEST_F(BestPracticesAnalyzerTest, UnnecessaryPass) {
        const auto findings = run("def f():\n    pass\n");

        ASSERT_EQ(findings.size(), 1u);
        EXPECT_EQ(findings[0].issue, "Unnecessary pass statement");
        EXPECT_EQ(findings[0].line, 2u);
    }

    TEST_F(BestPracticesAnalyzerTest, PassAfterExceptOrClass) {
        EXPECT_TRUE(run("try:\n    go()\nexcept ValueError:\n    pass\n").empty());
        EXPECT_TRUE(run("class Empty:\n    pass\n").empty());
    }

    TEST_F(BestPracticesAnalyzerTest, TodoMarkersInAnyLanguage) {
        const auto findings = run("let a = b;  // fixme later\n", "app.js");

        ASSERT_EQ(findings.size(), 1u);
        EXPECT_EQ(findings[0].issue, "TODO/FIXME comment found");
        EXPECT_EQ(findings[0].severity, Severity::Low);
    }

    TEST_F(BestPracticesAnalyzerTest, MagicNumbers) {
        const auto findings = run("timeout = 3600  # one hour\n");

        ASSERT_EQ(findings.size(), 1u);
        EXPECT_EQ(findings[0].issue, "Magic number detected");
        EXPECT_EQ(findings[0].snippet, "timeout = 3600");
    }

    TEST_F(BestPracticesAnalyzerTest, MagicNumberExemptions) {
        EXPECT_TRUE(run("for i in range(100):\n    step(i)\n").empty());
        EXPECT_TRUE(run("time.sleep(30)\n").empty());
        EXPECT_TRUE(run("x = 1  # retry 5000 times\n").empty());
        EXPECT_TRUE(run("name = v2\n").empty());
    }

    TEST_F(BestPracticesAnalyzerTest, DeepNestingReportedOnce) {
        const std::string deep(20, ' ');
        const auto findings = run("top()\n" + deep + "inner()\n" + deep + "inner()\n", "deep.txt");

        ASSERT_EQ(findings.size(), 1u);
        EXPECT_EQ(findings[0].issue, "Deeply nested code (5 levels)");
        EXPECT_EQ(findings[0].line, 2u);
        EXPECT_EQ(findings[0].severity, Severity::Medium);
    }

    TEST_F(BestPracticesAnalyzerTest, FourLevelsIsFine) {
        EXPECT_TRUE(run(std::string(16, ' ') + "inner()\n", "deep.txt").empty());
    }

    TEST_F(BestPracticesAnalyzerTest, CommentedOutCode) {
        const auto findings = run("run()\n# x = load()\n# y = x\n// z = y\n", "mixed.txt");

        ASSERT_EQ(findings.size(), 1u);
        EXPECT_EQ(findings[0].issue, "Large block of commented-out code");
        EXPECT_EQ(findings[0].line, 2u);
        EXPECT_EQ(findings[0].snippet, "Multiple lines of commented code");
    }

    TEST_F(BestPracticesAnalyzerTest, ProseCommentsAreNotCode) {
        EXPECT_TRUE(run("# this module loads\n# the user records\n# from disk\n").empty());
    }

    TEST_F(BestPracticesAnalyzerTest, MixedNaming) {
        const auto findings = run("userName\nuserAge\nuserMail\nuserPhone\n"
                                  "user_name\nuser_age\nuser_mail\nuser_phone\n", "names.txt");

        ASSERT_EQ(findings.size(), 1u);
        EXPECT_EQ(findings[0].issue, "Inconsistent naming convention");
        EXPECT_EQ(findings[0].line, 1u);
        EXPECT_EQ(findings[0].snippet, "Mixed camelCase (4) and snake_case (4)");
    }

    TEST_F(BestPracticesAnalyzerTest, NamingBelowThreshold) {
        EXPECT_TRUE(run("userName\nuserAge\nuserMail\nuser_name\nuser_age\nuser_mail\nuser_phone\n",
                        "names.txt").empty());
    }

    TEST_F(BestPracticesAnalyzerTest, VeryLongDefinition) {
        std::string text = "def big():";
        for (int i = 0; i < 100; ++i) {
            text += "\n    step()";
        }
        const auto findings = run(text, "big.txt");

        ASSERT_EQ(findings.size(), 1u);
        EXPECT_EQ(findings[0].issue, "Function \"big\" is very long (101 lines)");
        EXPECT_EQ(findings[0].line, 1u);
        EXPECT_EQ(findings[0].severity, Severity::Medium);
    }

    TEST_F(BestPracticesAnalyzerTest, EachLongDefinitionReported) {
        std::string text;
        for (const auto* name : {"first", "second"}) {
            text += std::string("def ") + name + "():\n";
            for (int i = 0; i < 101; ++i) {
                text += "    step()\n";
            }
        }
        const auto findings = run(text, "big.txt");

        ASSERT_EQ(findings.size(), 2u);
        EXPECT_EQ(findings[0].issue, "Function \"first\" is very long (102 lines)");
        EXPECT_EQ(findings[1].issue, "Function \"second\" is very long (103 lines)");
    }

    TEST_F(BestPracticesAnalyzerTest, Deterministic) {
        const std::string text = "print(a)\nexcept:\nx = 500\n# TODO: y\n";
        EXPECT_EQ(run(text), run(text));
    }

}  // namespace cca::analyzers

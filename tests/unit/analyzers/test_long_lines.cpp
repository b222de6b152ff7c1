//
// Created by gregorian-rayne on 2/13/26.
//

#include "cca/analyzers/all_analyzers.hpp"
#include "cca/analyzers/rules.hpp"

#include <gtest/gtest.h>

#include <algorithm>

namespace cca::analyzers {

    namespace {
        constexpr std::size_t MEGABYTE = 1 << 20;

        std::vector<Finding> run(const Category category, const std::string& text, const std::string& filename) {
            const auto analyzer = make_analyzer(category, nullptr);
            auto result = analyzer->analyze(text, filename);
            EXPECT_TRUE(result.is_ok());
            return result.is_ok() ? result.value() : std::vector<Finding>{};
        }

        bool has_issue(const std::vector<Finding>& findings, const std::string& issue) {
            return std::ranges::any_of(findings, [&](const Finding& f) { return f.issue == issue; });
        }
    }

    class LongLineTest : public ::testing::TestWithParam<Category> {};

    TEST_P(LongLineTest, MegabyteIdentifier) {
        const std::string line(MEGABYTE, 'a');
        for (const auto* filename : {"bundle.min.js", "blob.py"}) {
            for (const auto& finding : run(GetParam(), line, filename)) {
                EXPECT_LE(finding.snippet.size(), SNIPPET_MAX_LENGTH);
            }
        }
    }

    TEST_P(LongLineTest, MegabyteOfMixedTokens) {
        std::string line;
        line.reserve(MEGABYTE + 64);
        while (line.size() < MEGABYTE) {
            line += "fooBar foo_bar 12345 x + y, ";
        }
        (void)run(GetParam(), "def f(items=[]):\n    return " + line + "\n", "blob.py");
    }

    INSTANTIATE_TEST_SUITE_P(AllCategories, LongLineTest,
                             ::testing::ValuesIn(ALL_CATEGORIES),
                             [](const ::testing::TestParamInfo<Category>& info) {
                                 std::string name = to_string(info.param);
                                 name.erase(std::remove(name.begin(), name.end(), '_'), name.end());
                                 return name;
                             });

    TEST(LongLineSecurityTest, ConcatenationFoundBeyondMatchWindow) {
        const std::string line = "cursor.execute(\"x\" + \"" + std::string(MEGABYTE, 'a') + "\")";

        const auto findings = run(Category::Security, line, "app.py");
        EXPECT_TRUE(has_issue(findings, "SQL injection via concatenation"));
        EXPECT_TRUE(has_issue(findings, "SQL injection in cursor.execute"));
    }

    TEST(LongLineSecurityTest, ConcatenationScanEdgeCases) {
        const auto concatenation = [](const std::string& line) {
            return has_issue(run(Category::Security, line, "app.py"), "SQL injection via concatenation");
        };

        EXPECT_TRUE(concatenation("db.execute (q + x)"));
        EXPECT_TRUE(concatenation("db.execute(' ' + name)"));
        EXPECT_FALSE(concatenation("db.execute(+x)"));
        EXPECT_FALSE(concatenation("db.execute(q +)"));
        EXPECT_FALSE(concatenation("db.execute(q) + 1"));
        EXPECT_FALSE(concatenation("execute = q + r"));
    }

    TEST(LongLineBestPracticesTest, NamingCountedAcrossLines) {
        std::string text;
        for (int i = 0; i < 6; ++i) {
            text += "fooBar = foo_bar\n";
        }

        const auto findings = run(Category::BestPractices, text, "main.js");
        ASSERT_TRUE(has_issue(findings, "Inconsistent naming convention"));
    }

    TEST(LongLineQualityTest, LongLinePreviewIsValidUtf8) {
        // 79 ASCII bytes put a two-byte character across the 80-byte preview cut.
        std::string accented;
        for (int i = 0; i < 30; ++i) {
            accented += "\xC3\xA9";
        }

        const auto findings = run(Category::Quality, std::string(79, 'a') + accented, "app.py");
        ASSERT_TRUE(has_issue(findings, "Line too long"));
        const auto it = std::ranges::find(findings, std::string("Line too long"), &Finding::issue);
        EXPECT_EQ(it->snippet, std::string(79, 'a') + "...");
    }

}  // namespace cca::analyzers

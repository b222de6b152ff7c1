//
// Created by gregorian-rayne on 2/9/26.
//

#include "cca/types.hpp"

#include <gtest/gtest.h>

namespace cca
{
    TEST(TypesTest, SeverityNames) {
        EXPECT_STREQ(to_string(Severity::Low), "LOW");
        EXPECT_STREQ(to_string(Severity::Medium), "MEDIUM");
        EXPECT_STREQ(to_string(Severity::High), "HIGH");
        EXPECT_STREQ(to_string(Severity::Critical), "CRITICAL");
    }

    TEST(TypesTest, SeverityFromString) {
        EXPECT_EQ(severity_from_string("HIGH"), Severity::High);
        EXPECT_EQ(severity_from_string("critical"), Severity::Critical);
        EXPECT_FALSE(severity_from_string("SEVERE").has_value());
    }

    TEST(TypesTest, CategoryOrderIsMergeOrder) {
        ASSERT_EQ(ALL_CATEGORIES.size(), CATEGORY_COUNT);
        EXPECT_EQ(ALL_CATEGORIES[0], Category::Security);
        EXPECT_EQ(ALL_CATEGORIES[1], Category::Quality);
        EXPECT_EQ(ALL_CATEGORIES[2], Category::Performance);
        EXPECT_EQ(ALL_CATEGORIES[3], Category::BestPractices);

        for (std::size_t i = 0; i < CATEGORY_COUNT; ++i) {
            EXPECT_EQ(index_of(ALL_CATEGORIES[i]), i);
        }
    }

    TEST(TypesTest, CategoryRoundTripThroughName) {
        for (const auto category : ALL_CATEGORIES) {
            EXPECT_EQ(category_from_string(to_string(category)), category);
        }
        EXPECT_FALSE(category_from_string("style").has_value());
    }

    TEST(TypesTest, FindingsTables) {
        EXPECT_STREQ(findings_table(Category::Security), "security_findings");
        EXPECT_STREQ(findings_table(Category::Quality), "quality_findings");
        EXPECT_STREQ(findings_table(Category::Performance), "performance_findings");
        EXPECT_STREQ(findings_table(Category::BestPractices), "best_practices_findings");
    }

    TEST(TypesTest, DisplayNames) {
        EXPECT_STREQ(display_name(Category::BestPractices), "Best Practices");
        EXPECT_STREQ(display_name(Category::Security), "Security");
    }

    TEST(TypesTest, FailurePolicyNames) {
        EXPECT_EQ(failure_policy_from_string("all_or_nothing"), FailurePolicy::AllOrNothing);
        EXPECT_EQ(failure_policy_from_string("best-effort"), FailurePolicy::BestEffort);
        EXPECT_FALSE(failure_policy_from_string("retry").has_value());
        EXPECT_STREQ(to_string(FailurePolicy::BestEffort), "best_effort");
    }

    TEST(TypesTest, ModeNames) {
        EXPECT_STREQ(to_string(ExecutionMode::Sequential), "sequential");
        EXPECT_STREQ(to_string(ExecutionMode::Forked), "forked");
    }

    TEST(TypesTest, ReportTotalIsSumOfCategories) {
        Report report;
        report.at(Category::Security).count = 2;
        report.at(Category::Quality).count = 5;
        report.at(Category::Performance).count = 0;
        report.at(Category::BestPractices).count = 1;

        EXPECT_EQ(report.total_issues(), 8u);
        EXPECT_TRUE(report.is_complete());

        report.failures.push_back({Category::Performance, Error::store_error("down")});
        EXPECT_FALSE(report.is_complete());
    }

    TEST(TypesTest, FindingDefaults) {
        const Finding finding;
        EXPECT_EQ(finding.line, 1u);
        EXPECT_EQ(finding.severity, Severity::Low);
    }
}

//
// Created by gregorian-rayne on 2/9/26.
//

#ifndef CCA_TYPES_HPP
#define CCA_TYPES_HPP

/**
 * @file types.hpp
 * @brief Core data structures shared by analyzers, stores and the coordinator.
 *
 * - Basic Types: Duration, Timestamp, SubmissionId
 * - Enumerations: Severity, Category, ExecutionMode, FailurePolicy
 * - Records: Finding, Submission
 * - Aggregates: CategoryReport, AnalyzerFailure, Report
 *
 * Findings are value objects: they have no identity and are never updated
 * after an analyzer creates them.
 */

#include "cca/error.hpp"

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cca {

    // ============================================================================
    // Basic Types
    // ============================================================================

    using Duration = std::chrono::nanoseconds;
    using Timestamp = std::chrono::system_clock::time_point;

    /**
     * Store-assigned identifier of a submission. Strictly increasing.
     */
    using SubmissionId = std::int64_t;

    // ============================================================================
    // Enumerations
    // ============================================================================

    enum class Severity {
        Low,
        Medium,
        High,
        Critical
    };

    /**
     * Rule category. The enumerator order is the merge and presentation order.
     */
    enum class Category {
        Security,
        Quality,
        Performance,
        BestPractices
    };

    inline constexpr std::size_t CATEGORY_COUNT = 4;

    inline constexpr std::array<Category, CATEGORY_COUNT> ALL_CATEGORIES = {
        Category::Security,
        Category::Quality,
        Category::Performance,
        Category::BestPractices
    };

    enum class ExecutionMode {
        Sequential,  ///< All analyzers on the calling thread against the primary store
        Forked       ///< One worker per analyzer, each bound to its own store
    };

    /**
     * What the coordinator does when at least one analyzer fails.
     */
    enum class FailurePolicy {
        AllOrNothing,  ///< Discard everything and fail the submission
        BestEffort     ///< Merge and report the categories that succeeded
    };

    [[nodiscard]] const char* to_string(Severity severity) noexcept;
    [[nodiscard]] const char* to_string(Category category) noexcept;
    [[nodiscard]] const char* to_string(ExecutionMode mode) noexcept;
    [[nodiscard]] const char* to_string(FailurePolicy policy) noexcept;

    [[nodiscard]] std::optional<Severity> severity_from_string(std::string_view s) noexcept;
    [[nodiscard]] std::optional<Category> category_from_string(std::string_view s) noexcept;
    [[nodiscard]] std::optional<FailurePolicy> failure_policy_from_string(std::string_view s) noexcept;

    /**
     * Human-readable category name ("Best Practices").
     */
    [[nodiscard]] const char* display_name(Category category) noexcept;

    /**
     * Name of the per-category findings table ("security_findings", ...).
     */
    [[nodiscard]] const char* findings_table(Category category) noexcept;

    [[nodiscard]] constexpr std::size_t index_of(Category category) noexcept {
        return static_cast<std::size_t>(category);
    }

    // ============================================================================
    // Records
    // ============================================================================

    /**
     * One reported defect.
     *
     * File-scoped findings (connection counts, naming, very long definitions)
     * use line 1.
     */
    struct Finding {
        Category category = Category::Security;
        std::string issue;           // Issue kind label, e.g. "Hardcoded password"
        std::size_t line = 1;        // 1-based
        std::string snippet;         // Offending text, truncated
        Severity severity = Severity::Low;
        std::string remediation;

        bool operator==(const Finding&) const = default;
    };

    /**
     * One unit of source text registered for analysis.
     */
    struct Submission {
        SubmissionId id = 0;
        std::string filename;
        std::string content;
        Timestamp created_at;
    };

    // ============================================================================
    // Aggregates
    // ============================================================================

    struct CategoryReport {
        std::size_t count = 0;
        std::vector<Finding> findings;
    };

    struct AnalyzerFailure {
        Category category;
        Error error;
    };

    /**
     * Aggregate result of one submission.
     *
     * Derived from the merged findings; never persisted on its own.
     */
    struct Report {
        SubmissionId submission_id = 0;
        std::string filename;
        ExecutionMode mode = ExecutionMode::Sequential;
        std::array<CategoryReport, CATEGORY_COUNT> categories;
        std::vector<AnalyzerFailure> failures;  // Only populated under BestEffort

        [[nodiscard]] CategoryReport& at(Category category) noexcept {
            return categories[index_of(category)];
        }

        [[nodiscard]] const CategoryReport& at(Category category) const noexcept {
            return categories[index_of(category)];
        }

        /**
         * Sum of the four category counts.
         */
        [[nodiscard]] std::size_t total_issues() const noexcept {
            std::size_t total = 0;
            for (const auto& category : categories) {
                total += category.count;
            }
            return total;
        }

        [[nodiscard]] bool is_complete() const noexcept {
            return failures.empty();
        }
    };

}  // namespace cca

#endif //CCA_TYPES_HPP

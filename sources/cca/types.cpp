//
// Created by gregorian-rayne on 2/9/26.
//

#include "cca/types.hpp"
#include "cca/utils/string_utils.hpp"

namespace cca
{
    const char* to_string(const Severity severity) noexcept {
        switch (severity) {
            case Severity::Low:      return "LOW";
            case Severity::Medium:   return "MEDIUM";
            case Severity::High:     return "HIGH";
            case Severity::Critical: return "CRITICAL";
        }
        return "UNKNOWN";
    }

    const char* to_string(const Category category) noexcept {
        switch (category) {
            case Category::Security:      return "security";
            case Category::Quality:       return "quality";
            case Category::Performance:   return "performance";
            case Category::BestPractices: return "best_practices";
        }
        return "unknown";
    }

    const char* to_string(const ExecutionMode mode) noexcept {
        switch (mode) {
            case ExecutionMode::Sequential: return "sequential";
            case ExecutionMode::Forked:     return "forked";
        }
        return "unknown";
    }

    const char* to_string(const FailurePolicy policy) noexcept {
        switch (policy) {
            case FailurePolicy::AllOrNothing: return "all_or_nothing";
            case FailurePolicy::BestEffort:   return "best_effort";
        }
        return "unknown";
    }

    std::optional<Severity> severity_from_string(const std::string_view s) noexcept {
        if (string_utils::equals_ignore_case(s, "LOW")) return Severity::Low;
        if (string_utils::equals_ignore_case(s, "MEDIUM")) return Severity::Medium;
        if (string_utils::equals_ignore_case(s, "HIGH")) return Severity::High;
        if (string_utils::equals_ignore_case(s, "CRITICAL")) return Severity::Critical;
        return std::nullopt;
    }

    std::optional<Category> category_from_string(const std::string_view s) noexcept {
        for (const auto category : ALL_CATEGORIES) {
            if (s == to_string(category)) {
                return category;
            }
        }
        return std::nullopt;
    }

    std::optional<FailurePolicy> failure_policy_from_string(const std::string_view s) noexcept {
        if (s == "all_or_nothing" || s == "all-or-nothing") return FailurePolicy::AllOrNothing;
        if (s == "best_effort" || s == "best-effort") return FailurePolicy::BestEffort;
        return std::nullopt;
    }

    const char* display_name(const Category category) noexcept {
        switch (category) {
            case Category::Security:      return "Security";
            case Category::Quality:       return "Quality";
            case Category::Performance:   return "Performance";
            case Category::BestPractices: return "Best Practices";
        }
        return "Unknown";
    }

    const char* findings_table(const Category category) noexcept {
        switch (category) {
            case Category::Security:      return "security_findings";
            case Category::Quality:       return "quality_findings";
            case Category::Performance:   return "performance_findings";
            case Category::BestPractices: return "best_practices_findings";
        }
        return "unknown_findings";
    }

}  // namespace cca

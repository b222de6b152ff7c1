//
// Created by gregorian-rayne on 2/12/26.
//

#include "cca/coordinator/events.hpp"
#include "cca/logging.hpp"

#include <chrono>

namespace cca::coordinator
{
    void LoggingObserver::on_submission_registered(const SubmissionId id, const std::string_view filename,
                                                   const ExecutionMode mode) {
        CCA_LOG_INFO("Submission {} registered for '{}' ({} mode)", id, filename, to_string(mode));
    }

    void LoggingObserver::on_analyzer_started(const SubmissionId id, const Category category) {
        CCA_LOG_DEBUG("[{}] {} analyzer started", id, display_name(category));
    }

    void LoggingObserver::on_analyzer_finished(const SubmissionId id, const Category category,
                                               const std::size_t finding_count, const Duration elapsed) {
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
        CCA_LOG_DEBUG("[{}] {} analyzer finished: {} findings in {} ms",
                      id, display_name(category), finding_count, ms);
    }

    void LoggingObserver::on_analyzer_failed(const SubmissionId id, const Category category, const Error& error) {
        CCA_LOG_WARN("[{}] {} analyzer failed: {}", id, display_name(category), error.to_string());
    }

    void LoggingObserver::on_findings_merged(const SubmissionId id, const std::size_t row_count) {
        CCA_LOG_DEBUG("[{}] merged {} findings", id, row_count);
    }

    void LoggingObserver::on_submission_completed(const Report& report) {
        CCA_LOG_INFO("Submission {} complete: {} issues (security {}, quality {}, performance {}, best practices {})",
                     report.submission_id,
                     report.total_issues(),
                     report.at(Category::Security).count,
                     report.at(Category::Quality).count,
                     report.at(Category::Performance).count,
                     report.at(Category::BestPractices).count);
    }

    void LoggingObserver::on_submission_failed(const std::optional<SubmissionId> id, const Error& error) {
        if (id) {
            CCA_LOG_ERROR("Submission {} failed: {}", *id, error.to_string());
        } else {
            CCA_LOG_ERROR("Submission failed: {}", error.to_string());
        }
    }

}  // namespace cca::coordinator

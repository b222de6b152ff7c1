//
// Created by gregorian-rayne on 2/12/26.
//

#ifndef CCA_EVENTS_HPP
#define CCA_EVENTS_HPP

/**
 * @file events.hpp
 * @brief Structured progress events emitted by the coordinator.
 *
 * In forked mode the analyzer callbacks arrive on worker threads, possibly
 * at the same time; observers must be thread-safe.
 */

#include "cca/types.hpp"
#include "cca/error.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string_view>

namespace cca::coordinator {

    class IAnalysisObserver {
    public:
        virtual ~IAnalysisObserver() = default;

        virtual void on_submission_registered(SubmissionId /*id*/, std::string_view /*filename*/,
                                              ExecutionMode /*mode*/) {}

        virtual void on_analyzer_started(SubmissionId /*id*/, Category /*category*/) {}

        virtual void on_analyzer_finished(SubmissionId /*id*/, Category /*category*/,
                                          std::size_t /*finding_count*/, Duration /*elapsed*/) {}

        virtual void on_analyzer_failed(SubmissionId /*id*/, Category /*category*/, const Error& /*error*/) {}

        virtual void on_findings_merged(SubmissionId /*id*/, std::size_t /*row_count*/) {}

        virtual void on_submission_completed(const Report& /*report*/) {}

        /**
         * @param id Empty when the failure happened before an id was assigned.
         */
        virtual void on_submission_failed(std::optional<SubmissionId> /*id*/, const Error& /*error*/) {}
    };

    /**
     * Writes every event to the "cca" logger. Analyzer progress is logged at
     * debug level, outcomes at info, failures at warn and error.
     */
    class LoggingObserver final : public IAnalysisObserver {
    public:
        void on_submission_registered(SubmissionId id, std::string_view filename, ExecutionMode mode) override;
        void on_analyzer_started(SubmissionId id, Category category) override;
        void on_analyzer_finished(SubmissionId id, Category category,
                                  std::size_t finding_count, Duration elapsed) override;
        void on_analyzer_failed(SubmissionId id, Category category, const Error& error) override;
        void on_findings_merged(SubmissionId id, std::size_t row_count) override;
        void on_submission_completed(const Report& report) override;
        void on_submission_failed(std::optional<SubmissionId> id, const Error& error) override;
    };

    using ObserverPtr = std::shared_ptr<IAnalysisObserver>;

}  // namespace cca::coordinator

#endif //CCA_EVENTS_HPP

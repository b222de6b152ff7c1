//
// Created by gregorian-rayne on 2/12/26.
//

#ifndef CCA_COORDINATOR_HPP
#define CCA_COORDINATOR_HPP

/**
 * @file coordinator.hpp
 * @brief Runs the four analyzers over a submission and merges their output.
 *
 * A submission moves through Submitted -> Dispatched -> Executing ->
 * Collected -> Merged -> Reported:
 *
 * 1. The primary store assigns the submission id, once, before any analyzer
 *    runs.
 * 2. The execution mode follows from the configuration alone. With isolated
 *    stores for security and quality, all four analyzers run concurrently on
 *    a pool of four workers, each persisting to its own store (or to the
 *    primary store when it has none). Otherwise they run one after another on
 *    the calling thread against the primary store.
 * 3. All four invocations are awaited. Nothing is cancelled or timed out.
 * 4. Findings are copied into merged_findings on the primary store, tagged
 *    with their category, in the order Security, Quality, Performance,
 *    BestPractices.
 * 5. The Report is assembled from the merged findings.
 *
 * Under FailurePolicy::AllOrNothing any analyzer failure fails the whole
 * submission with the first error in category order and nothing is merged.
 * Under FailurePolicy::BestEffort the failed categories report no findings
 * and their errors are listed in Report::failures.
 */

#include "cca/config.hpp"
#include "cca/result.hpp"
#include "cca/types.hpp"
#include "cca/coordinator/events.hpp"
#include "cca/storage/finding_store.hpp"

#include <memory>
#include <string>
#include <vector>

namespace cca::coordinator {

    class Coordinator {
    public:
        /**
         * Validates the configuration and opens the primary store.
         *
         * @param config Validated here; a ConfigError is returned as is.
         * @param observer Receives progress events. Defaults to a LoggingObserver.
         * @param opener Opens stores from URLs. Defaults to storage::open_store.
         */
        [[nodiscard]] static Result<std::unique_ptr<Coordinator>> create(
            CoordinatorConfig config,
            ObserverPtr observer = nullptr,
            storage::StoreOpener opener = storage::open_store);

        Coordinator(const Coordinator&) = delete;
        Coordinator& operator=(const Coordinator&) = delete;

        /**
         * Analyzes one unit of source text.
         *
         * @return The complete report, or the error that failed the submission.
         */
        [[nodiscard]] Result<Report> submit(const std::string& content, const std::string& filename);

        [[nodiscard]] ExecutionMode mode() const noexcept {
            return mode_;
        }

        [[nodiscard]] const CoordinatorConfig& config() const noexcept {
            return config_;
        }

        [[nodiscard]] const storage::StorePtr& primary_store() const noexcept {
            return primary_;
        }

    private:
        Coordinator(CoordinatorConfig config, ObserverPtr observer,
                    storage::StoreOpener opener, storage::StorePtr primary);

        /**
         * The store an analyzer persists to. Forks are opened per submission
         * so that each forked analyzer owns its own connection.
         */
        [[nodiscard]] Result<storage::StorePtr> store_for(Category category) const;

        /**
         * Analyzes and persists one category. Never throws.
         */
        [[nodiscard]] Result<std::vector<Finding>> run_analyzer(Category category,
                                                                SubmissionId id,
                                                                const std::string& content,
                                                                const std::string& filename) const;

        [[nodiscard]] std::vector<Result<std::vector<Finding>>> run_sequential(
            SubmissionId id, const std::string& content, const std::string& filename) const;

        [[nodiscard]] std::vector<Result<std::vector<Finding>>> run_forked(
            SubmissionId id, const std::string& content, const std::string& filename) const;

        /**
         * Inserts every collected finding into merged_findings in one batch.
         */
        [[nodiscard]] Result<std::size_t> merge(SubmissionId id,
                                                const std::vector<Result<std::vector<Finding>>>& outcomes) const;

        CoordinatorConfig config_;
        ExecutionMode mode_;
        ObserverPtr observer_;
        storage::StoreOpener opener_;
        storage::StorePtr primary_;
    };

}  // namespace cca::coordinator

#endif //CCA_COORDINATOR_HPP

//
// Created by gregorian-rayne on 2/12/26.
//

#include "cca/coordinator/coordinator.hpp"
#include "cca/analyzers/all_analyzers.hpp"
#include "cca/utils/parallel.hpp"
#include "cca/logging.hpp"

#include <chrono>
#include <exception>
#include <future>

namespace cca::coordinator
{
    namespace {
        using Outcome = Result<std::vector<Finding>>;

        Error tag_with_category(const Error& error, const Category category) {
            return error.with_context(std::string(to_string(category)) + " analyzer");
        }
    }

    Result<std::unique_ptr<Coordinator>> Coordinator::create(CoordinatorConfig config,
                                                             ObserverPtr observer,
                                                             storage::StoreOpener opener) {
        if (auto valid = config.validate(); valid.is_err()) {
            return Result<std::unique_ptr<Coordinator>>::failure(valid.error());
        }

        if (!observer) {
            observer = std::make_shared<LoggingObserver>();
        }
        if (!opener) {
            opener = storage::open_store;
        }

        auto primary = opener(config.primary_store_url);
        if (primary.is_err()) {
            return Result<std::unique_ptr<Coordinator>>::failure(
                primary.error().with_context("primary store"));
        }

        CCA_LOG_DEBUG("Coordinator ready: primary store {}, {} mode, {} policy",
                      config.primary_store_url, to_string(config.execution_mode()),
                      to_string(config.failure_policy));

        return Result<std::unique_ptr<Coordinator>>::success(std::unique_ptr<Coordinator>(
            new Coordinator(std::move(config), std::move(observer), std::move(opener),
                            std::move(primary).value())));
    }

    Coordinator::Coordinator(CoordinatorConfig config, ObserverPtr observer,
                             storage::StoreOpener opener, storage::StorePtr primary)
        : config_(std::move(config))
        , mode_(config_.execution_mode())
        , observer_(std::move(observer))
        , opener_(std::move(opener))
        , primary_(std::move(primary)) {}

    Result<storage::StorePtr> Coordinator::store_for(const Category category) const {
        if (mode_ == ExecutionMode::Forked && config_.has_fork(category)) {
            return opener_(config_.store_url_for(category));
        }
        return Result<storage::StorePtr>::success(primary_);
    }

    Result<std::vector<Finding>> Coordinator::run_analyzer(const Category category,
                                                           const SubmissionId id,
                                                           const std::string& content,
                                                           const std::string& filename) const {
        observer_->on_analyzer_started(id, category);
        const auto start = std::chrono::steady_clock::now();

        auto outcome = [&]() -> Outcome {
            try {
                auto store = store_for(category);
                if (store.is_err()) {
                    return Outcome::failure(store.error());
                }

                const auto analyzer = analyzers::make_analyzer(category, std::move(store).value());
                auto findings = analyzer->analyze(content, filename);
                if (findings.is_err()) {
                    return findings;
                }

                if (auto persisted = analyzer->persist(findings.value(), id); persisted.is_err()) {
                    return Outcome::failure(persisted.error());
                }
                return findings;
            } catch (const std::exception& e) {
                return Outcome::failure(Error::internal_error(std::string("Analyzer threw: ") + e.what()));
            } catch (...) {
                return Outcome::failure(Error::internal_error("Analyzer threw a non-standard exception"));
            }
        }();

        if (outcome.is_err()) {
            outcome = Outcome::failure(tag_with_category(outcome.error(), category));
            observer_->on_analyzer_failed(id, category, outcome.error());
        } else {
            observer_->on_analyzer_finished(id, category, outcome.value().size(),
                                            std::chrono::steady_clock::now() - start);
        }
        return outcome;
    }

    std::vector<Result<std::vector<Finding>>> Coordinator::run_sequential(const SubmissionId id,
                                                                          const std::string& content,
                                                                          const std::string& filename) const {
        std::vector<Outcome> outcomes;
        outcomes.reserve(CATEGORY_COUNT);
        for (const auto category : ALL_CATEGORIES) {
            outcomes.push_back(run_analyzer(category, id, content, filename));
        }
        return outcomes;
    }

    std::vector<Result<std::vector<Finding>>> Coordinator::run_forked(const SubmissionId id,
                                                                      const std::string& content,
                                                                      const std::string& filename) const {
        parallel::ThreadPool pool(static_cast<unsigned int>(CATEGORY_COUNT));

        std::vector<std::future<Outcome>> futures;
        futures.reserve(CATEGORY_COUNT);
        for (const auto category : ALL_CATEGORIES) {
            futures.push_back(pool.submit([this, category, id, &content, &filename] {
                return run_analyzer(category, id, content, filename);
            }));
        }

        // Slots stay in category order whatever the completion order.
        auto outcomes = parallel::collect_all(std::move(futures));
        for (std::size_t i = 0; i < outcomes.size(); ++i) {
            if (outcomes[i].is_err() && outcomes[i].error().code() == ErrorCode::InternalError &&
                !outcomes[i].error().has_context()) {
                outcomes[i] = Outcome::failure(tag_with_category(outcomes[i].error(), ALL_CATEGORIES[i]));
            }
        }
        return outcomes;
    }

    Result<std::size_t> Coordinator::merge(const SubmissionId id, const std::vector<Outcome>& outcomes) const {
        if (auto schema = primary_->ensure_schema(storage::merged_findings_schema()); schema.is_err()) {
            return Result<std::size_t>::failure(schema.error());
        }

        std::vector<storage::FindingRow> rows;
        for (const auto& outcome : outcomes) {
            if (outcome.is_err()) {
                continue;
            }
            for (const auto& finding : outcome.value()) {
                rows.push_back(storage::to_row(finding, id, true));
            }
        }

        return primary_->insert(storage::MERGED_FINDINGS_TABLE, rows);
    }

    Result<Report> Coordinator::submit(const std::string& content, const std::string& filename) {
        auto id_result = primary_->new_submission_id(filename, content);
        if (id_result.is_err()) {
            auto error = id_result.error().with_context("registering submission");
            observer_->on_submission_failed(std::nullopt, error);
            return Result<Report>::failure(std::move(error));
        }
        const SubmissionId id = id_result.value();
        observer_->on_submission_registered(id, filename, mode_);

        const auto outcomes = mode_ == ExecutionMode::Forked
            ? run_forked(id, content, filename)
            : run_sequential(id, content, filename);

        Report report;
        report.submission_id = id;
        report.filename = filename;
        report.mode = mode_;

        for (std::size_t i = 0; i < outcomes.size(); ++i) {
            if (outcomes[i].is_ok()) {
                continue;
            }
            if (config_.failure_policy == FailurePolicy::AllOrNothing) {
                observer_->on_submission_failed(id, outcomes[i].error());
                return Result<Report>::failure(outcomes[i].error());
            }
            report.failures.push_back(AnalyzerFailure{ALL_CATEGORIES[i], outcomes[i].error()});
        }

        auto merged = merge(id, outcomes);
        if (merged.is_err()) {
            auto error = merged.error().with_context("merging findings");
            observer_->on_submission_failed(id, error);
            return Result<Report>::failure(std::move(error));
        }
        observer_->on_findings_merged(id, merged.value());

        for (std::size_t i = 0; i < outcomes.size(); ++i) {
            if (outcomes[i].is_err()) {
                continue;
            }
            auto& category = report.categories[i];
            category.findings = outcomes[i].value();
            category.count = category.findings.size();
        }

        observer_->on_submission_completed(report);
        return Result<Report>::success(std::move(report));
    }

}  // namespace cca::coordinator

//
// Created by gregorian-rayne on 2/11/26.
//

#ifndef CCA_ANALYZER_HPP
#define CCA_ANALYZER_HPP

/**
 * @file analyzer.hpp
 * @brief Analyzer interface shared by the four rule categories.
 *
 * Analyzer types:
 * - SecurityAnalyzer: Hardcoded secrets, SQL injection, dynamic evaluation
 * - QualityAnalyzer: Function length, line length, docstrings, duplicates
 * - PerformanceAnalyzer: Query patterns, nested loops, connection reuse
 * - BestPracticesAnalyzer: Language idioms and general hygiene
 *
 * analyze() is a pure function of its input. persist() writes to the store
 * the analyzer was constructed with, which is either the primary store or
 * an isolated fork.
 */

#include "cca/result.hpp"
#include "cca/error.hpp"
#include "cca/types.hpp"
#include "cca/storage/finding_store.hpp"

#include <string>
#include <string_view>
#include <vector>
#include <memory>

namespace cca::analyzers {

    /**
     * Base interface for all analyzers.
     */
    class IAnalyzer {
    public:
        explicit IAnalyzer(storage::StorePtr store)
            : store_(std::move(store)) {}

        virtual ~IAnalyzer() = default;

        [[nodiscard]] virtual Category category() const noexcept = 0;

        /**
         * Returns the analyzer name.
         */
        [[nodiscard]] virtual std::string_view name() const noexcept = 0;

        /**
         * Returns a description of what this analyzer does.
         */
        [[nodiscard]] virtual std::string_view description() const noexcept = 0;

        /**
         * Runs the rules over text.
         *
         * Identical input yields an identical, order-stable result. Text
         * containing NUL bytes is rejected with AnalysisError.
         *
         * @param text Raw source text.
         * @param filename Used for language detection only.
         */
        [[nodiscard]] Result<std::vector<Finding>> analyze(std::string_view text,
                                                           std::string_view filename) const;

        /**
         * Creates this analyzer's findings table if needed and appends the
         * findings to it in one batch. Not idempotent: persisting twice
         * stores the rows twice.
         *
         * @return Number of rows written.
         */
        [[nodiscard]] Result<std::size_t> persist(const std::vector<Finding>& findings,
                                                  SubmissionId submission_id) const;

        [[nodiscard]] const storage::StorePtr& store() const noexcept {
            return store_;
        }

    protected:
        /**
         * Rule evaluation proper. lines are views into the analyzed text.
         */
        [[nodiscard]] virtual std::vector<Finding> detect(const std::vector<std::string_view>& lines,
                                                          std::string_view text,
                                                          std::string_view filename) const = 0;

    private:
        storage::StorePtr store_;
    };

    using AnalyzerPtr = std::unique_ptr<IAnalyzer>;

}  // namespace cca::analyzers

#endif //CCA_ANALYZER_HPP

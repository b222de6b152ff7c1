//
// Created by gregorian-rayne on 2/11/26.
//

#ifndef CCA_PERFORMANCE_ANALYZER_HPP
#define CCA_PERFORMANCE_ANALYZER_HPP

/**
 * @file performance_analyzer.hpp
 * @brief Query and loop performance heuristics.
 *
 * Rules, in output order:
 * - N+1 queries: a query call within 4 lines of a loop
 * - WHERE clauses that might need an index
 * - SELECT *
 * - Nested loops
 * - More than one connect() call in the file (reported once, at line 1)
 * - fetchall()
 * - String concatenation inside a loop
 * - append() inside a loop
 */

#include "cca/analyzers/analyzer.hpp"

namespace cca::analyzers {

    class PerformanceAnalyzer final : public IAnalyzer {
    public:
        static constexpr std::size_t QUERY_LOOKAHEAD = 4;
        static constexpr std::size_t NESTED_LOOP_DISTANCE = 20;
        static constexpr std::size_t CONCATENATION_WINDOW = 10;
        static constexpr std::size_t APPEND_WINDOW = 3;

        using IAnalyzer::IAnalyzer;

        [[nodiscard]] Category category() const noexcept override {
            return Category::Performance;
        }

        [[nodiscard]] std::string_view name() const noexcept override {
            return "PerformanceAnalyzer";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Finds N+1 queries, unbounded fetches, nested loops and connection churn";
        }

    protected:
        [[nodiscard]] std::vector<Finding> detect(const std::vector<std::string_view>& lines,
                                                  std::string_view text,
                                                  std::string_view filename) const override;
    };

}  // namespace cca::analyzers

#endif //CCA_PERFORMANCE_ANALYZER_HPP

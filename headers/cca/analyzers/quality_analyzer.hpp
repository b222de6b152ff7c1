//
// Created by gregorian-rayne on 2/11/26.
//

#ifndef CCA_QUALITY_ANALYZER_HPP
#define CCA_QUALITY_ANALYZER_HPP

/**
 * @file quality_analyzer.hpp
 * @brief Structural code quality checks.
 *
 * Rules, in output order:
 * - Long functions (more than 50 lines), MEDIUM
 * - Long lines (more than 120 characters), LOW
 * - Definitions without a docstring, LOW
 * - Lines of more than 20 characters repeated three or more times, MEDIUM
 *
 * Function spans are found by indentation reset: a definition opens a span,
 * the next non-empty line starting at column 0 closes it.
 */

#include "cca/analyzers/analyzer.hpp"

namespace cca::analyzers {

    class QualityAnalyzer final : public IAnalyzer {
    public:
        static constexpr std::size_t MAX_FUNCTION_LENGTH = 50;
        static constexpr std::size_t MAX_LINE_LENGTH = 120;
        static constexpr std::size_t LONG_LINE_PREVIEW = 80;
        static constexpr std::size_t DUPLICATE_PREVIEW = 50;
        static constexpr std::size_t DOCSTRING_WINDOW = 3;
        static constexpr std::size_t MIN_DUPLICATE_LENGTH = 20;
        static constexpr std::size_t MIN_DUPLICATE_COUNT = 3;

        using IAnalyzer::IAnalyzer;

        [[nodiscard]] Category category() const noexcept override {
            return Category::Quality;
        }

        [[nodiscard]] std::string_view name() const noexcept override {
            return "QualityAnalyzer";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Checks function length, line length, docstrings and duplicated lines";
        }

    protected:
        [[nodiscard]] std::vector<Finding> detect(const std::vector<std::string_view>& lines,
                                                  std::string_view text,
                                                  std::string_view filename) const override;
    };

}  // namespace cca::analyzers

#endif //CCA_QUALITY_ANALYZER_HPP

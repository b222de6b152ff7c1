//
// Created by gregorian-rayne on 2/11/26.
//

#ifndef CCA_BEST_PRACTICES_ANALYZER_HPP
#define CCA_BEST_PRACTICES_ANALYZER_HPP

/**
 * @file best_practices_analyzer.hpp
 * @brief Language idioms and general coding hygiene.
 *
 * Python files get a table of per-line idiom rules (bare except, mutable
 * defaults, lambda assignment, ...). Every file then gets the general rules:
 * TODO markers, magic numbers, deep nesting, commented-out code, mixed
 * naming conventions and very long definitions.
 */

#include "cca/analyzers/analyzer.hpp"

namespace cca::analyzers {

    enum class Language {
        Python,
        JavaScript,
        TypeScript,
        Java,
        Go,
        Ruby,
        Cpp,
        C,
        Unknown
    };

    [[nodiscard]] const char* to_string(Language language) noexcept;

    class BestPracticesAnalyzer final : public IAnalyzer {
    public:
        static constexpr std::size_t MAX_NESTING_LEVEL = 4;
        static constexpr std::size_t INDENT_WIDTH = 4;
        static constexpr std::size_t COMMENTED_CODE_RUN = 3;
        static constexpr std::size_t NAMING_THRESHOLD = 3;
        static constexpr std::size_t MAX_DEFINITION_LENGTH = 100;

        using IAnalyzer::IAnalyzer;

        [[nodiscard]] Category category() const noexcept override {
            return Category::BestPractices;
        }

        [[nodiscard]] std::string_view name() const noexcept override {
            return "BestPracticesAnalyzer";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Checks language idioms and general coding hygiene";
        }

        /**
         * Maps the filename extension (case-insensitive) to a language.
         * A name without a dot is treated as a bare extension.
         */
        [[nodiscard]] static Language detect_language(std::string_view filename);

    protected:
        [[nodiscard]] std::vector<Finding> detect(const std::vector<std::string_view>& lines,
                                                  std::string_view text,
                                                  std::string_view filename) const override;
    };

}  // namespace cca::analyzers

#endif //CCA_BEST_PRACTICES_ANALYZER_HPP

//
// Created by gregorian-rayne on 2/11/26.
//

#ifndef CCA_SECURITY_ANALYZER_HPP
#define CCA_SECURITY_ANALYZER_HPP

/**
 * @file security_analyzer.hpp
 * @brief Hardcoded secrets, SQL injection and dynamic evaluation.
 *
 * Three rule tables, evaluated in this order:
 * - secrets (HIGH): password, API key, secret, token assignments; AWS keys
 * - injection (CRITICAL): execute() built from f-strings, % formatting or +
 * - dynamic evaluation (HIGH): eval(), exec(), __import__()
 */

#include "cca/analyzers/analyzer.hpp"

namespace cca::analyzers {

    class SecurityAnalyzer final : public IAnalyzer {
    public:
        using IAnalyzer::IAnalyzer;

        [[nodiscard]] Category category() const noexcept override {
            return Category::Security;
        }

        [[nodiscard]] std::string_view name() const noexcept override {
            return "SecurityAnalyzer";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Detects hardcoded secrets, SQL injection and dangerous dynamic evaluation";
        }

    protected:
        [[nodiscard]] std::vector<Finding> detect(const std::vector<std::string_view>& lines,
                                                  std::string_view text,
                                                  std::string_view filename) const override;
    };

}  // namespace cca::analyzers

#endif //CCA_SECURITY_ANALYZER_HPP

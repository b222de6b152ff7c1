//
// Created by gregorian-rayne on 2/11/26.
//

#ifndef CCA_RULES_HPP
#define CCA_RULES_HPP

/**
 * @file rules.hpp
 * @brief Building blocks shared by the line-oriented analyzers.
 *
 * A LineRule is a line matcher plus the finding it produces. Analyzers keep their
 * rules in ordered tables and evaluate a table line-major, rule-minor: every
 * rule is tried on line 1, then every rule on line 2, and so on. Every match
 * is an independent finding.
 *
 * std::regex backtracks recursively, so no pattern ever sees more than the
 * first MATCH_WINDOW bytes of a line. Rules that need the whole line are
 * written as scans instead of regexes.
 */

#include "cca/types.hpp"

#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace cca::analyzers {

    inline constexpr std::size_t SNIPPET_MAX_LENGTH = 200;
    inline constexpr std::size_t MATCH_WINDOW = 4096;

    using LineScan = bool (*)(std::string_view line);

    /// Matches through @c scan when set, otherwise through @c pattern.
    struct LineRule {
        std::regex pattern;
        std::string issue;
        Severity severity = Severity::Low;
        std::string remediation;
        LineScan scan = nullptr;
    };

    [[nodiscard]] LineRule make_rule(const char* pattern,
                                     std::string issue,
                                     Severity severity,
                                     std::string remediation,
                                     bool ignore_case = false);

    [[nodiscard]] LineRule make_scan_rule(LineScan scan,
                                          std::string issue,
                                          Severity severity,
                                          std::string remediation);

    /**
     * Splits on '\n' only. A trailing '\r' stays part of the line, and text
     * ending in '\n' has a final empty line.
     */
    [[nodiscard]] std::vector<std::string_view> split_lines(std::string_view text);

    /**
     * Strips surrounding whitespace and cuts to SNIPPET_MAX_LENGTH bytes on
     * a UTF-8 boundary.
     */
    [[nodiscard]] std::string snippet_of(std::string_view line);

    /**
     * Builds a finding. The snippet is cut like snippet_of() but not
     * trimmed.
     */
    [[nodiscard]] Finding make_finding(Category category,
                                       std::string issue,
                                       std::size_t line,
                                       std::string_view snippet,
                                       Severity severity,
                                       std::string remediation);

    /**
     * Evaluates one rule table over all lines, appending to out.
     */
    void apply_line_rules(Category category,
                          const std::vector<LineRule>& rules,
                          const std::vector<std::string_view>& lines,
                          std::vector<Finding>& out);

    /// Searches the first MATCH_WINDOW bytes of @p text.
    [[nodiscard]] bool matches(const std::regex& pattern, std::string_view text);

    [[nodiscard]] bool matches(const LineRule& rule, std::string_view line);

    /// The part of @p text a regex is allowed to see.
    [[nodiscard]] std::string_view match_window(std::string_view text) noexcept;

    /**
     * True for a line with "for" or "while" as a whole word followed by
     * whitespace.
     */
    [[nodiscard]] bool is_loop_opening(std::string_view line);

    /**
     * True when the stripped line starts with '#' or "//".
     */
    [[nodiscard]] bool is_comment_line(std::string_view line) noexcept;

}  // namespace cca::analyzers

#endif //CCA_RULES_HPP

//
// Created by gregorian-rayne on 2/11/26.
//

#include "cca/analyzers/rules.hpp"
#include "cca/utils/string_utils.hpp"

namespace cca::analyzers {

    LineRule make_rule(const char* pattern,
                       std::string issue,
                       const Severity severity,
                       std::string remediation,
                       const bool ignore_case) {
        auto flags = std::regex::ECMAScript | std::regex::optimize;
        if (ignore_case) {
            flags |= std::regex::icase;
        }
        return LineRule{std::regex(pattern, flags), std::move(issue), severity, std::move(remediation)};
    }

    LineRule make_scan_rule(const LineScan scan,
                            std::string issue,
                            const Severity severity,
                            std::string remediation) {
        LineRule rule;
        rule.issue = std::move(issue);
        rule.severity = severity;
        rule.remediation = std::move(remediation);
        rule.scan = scan;
        return rule;
    }

    std::vector<std::string_view> split_lines(const std::string_view text) {
        return string_utils::split(text, '\n');
    }

    std::string snippet_of(const std::string_view line) {
        return std::string(string_utils::utf8_prefix(string_utils::trim(line), SNIPPET_MAX_LENGTH));
    }

    Finding make_finding(const Category category,
                         std::string issue,
                         const std::size_t line,
                         const std::string_view snippet,
                         const Severity severity,
                         std::string remediation) {
        Finding finding;
        finding.category = category;
        finding.issue = std::move(issue);
        finding.line = line;
        finding.snippet = std::string(string_utils::utf8_prefix(snippet, SNIPPET_MAX_LENGTH));
        finding.severity = severity;
        finding.remediation = std::move(remediation);
        return finding;
    }

    std::string_view match_window(const std::string_view text) noexcept {
        return text.substr(0, MATCH_WINDOW);
    }

    bool matches(const std::regex& pattern, const std::string_view text) {
        const auto window = match_window(text);
        return std::regex_search(window.begin(), window.end(), pattern);
    }

    bool matches(const LineRule& rule, const std::string_view line) {
        return rule.scan ? rule.scan(line) : matches(rule.pattern, line);
    }

    void apply_line_rules(const Category category,
                          const std::vector<LineRule>& rules,
                          const std::vector<std::string_view>& lines,
                          std::vector<Finding>& out) {
        for (std::size_t i = 0; i < lines.size(); ++i) {
            for (const auto& rule : rules) {
                if (matches(rule, lines[i])) {
                    out.push_back(make_finding(category, rule.issue, i + 1, snippet_of(lines[i]),
                                               rule.severity, rule.remediation));
                }
            }
        }
    }

    bool is_loop_opening(const std::string_view line) {
        static const std::regex loop_pattern(R"(\b(for|while)\s)", std::regex::ECMAScript | std::regex::optimize);
        return matches(loop_pattern, line);
    }

    bool is_comment_line(const std::string_view line) noexcept {
        const auto stripped = string_utils::trim(line);
        return string_utils::starts_with(stripped, "#") || string_utils::starts_with(stripped, "//");
    }

}  // namespace cca::analyzers

//
// Created by gregorian-rayne on 2/11/26.
//

#include "cca/analyzers/performance_analyzer.hpp"
#include "cca/analyzers/rules.hpp"
#include "cca/utils/string_utils.hpp"

#include <algorithm>
#include <array>
#include <regex>
#include <utility>

namespace cca::analyzers
{
    namespace {

        using string_utils::contains;

        /**
         * Per-line facts shared by several rules, computed once.
         */
        struct LineIndex {
            std::vector<std::string> lowered;
            std::vector<bool> opens_loop;

            explicit LineIndex(const std::vector<std::string_view>& lines) {
                lowered.reserve(lines.size());
                opens_loop.reserve(lines.size());
                for (const auto line : lines) {
                    lowered.push_back(string_utils::to_lower(line));
                    opens_loop.push_back(is_loop_opening(line));
                }
            }

            /**
             * True when one of the `window` lines directly above line i opens a loop.
             */
            [[nodiscard]] bool loop_above(const std::size_t i, const std::size_t window) const {
                const std::size_t first = i >= window ? i - window : 0;
                for (std::size_t k = first; k < i; ++k) {
                    if (opens_loop[k]) {
                        return true;
                    }
                }
                return false;
            }
        };

        Finding performance_finding(std::string issue, const std::size_t line, const std::string_view snippet,
                                    const Severity severity, std::string remediation) {
            return make_finding(Category::Performance, std::move(issue), line, snippet, severity, std::move(remediation));
        }

        void detect_n_plus_one(const std::vector<std::string_view>& lines, const LineIndex& index,
                               std::vector<Finding>& out) {
            constexpr std::array<std::string_view, 4> query_words = {"execute", "query", "select", "fetch"};

            for (std::size_t i = 0; i < lines.size(); ++i) {
                if (!contains(index.lowered[i], "for ")) {
                    continue;
                }
                for (std::size_t offset = 1; offset <= PerformanceAnalyzer::QUERY_LOOKAHEAD; ++offset) {
                    const std::size_t j = i + offset;
                    if (j >= lines.size()) {
                        break;
                    }
                    const bool queries = std::ranges::any_of(query_words, [&](const std::string_view word) {
                        return contains(index.lowered[j], word);
                    });
                    if (queries) {
                        out.push_back(performance_finding("Potential N+1 query problem", i + 1, snippet_of(lines[i]),
                                                          Severity::High,
                                                          "Move query outside loop or use batch query with JOIN"));
                        break;
                    }
                }
            }
        }

        void detect_missing_index(const std::vector<std::string_view>& lines, const LineIndex& index,
                                  std::vector<Finding>& out) {
            for (std::size_t i = 0; i < lines.size(); ++i) {
                const auto& lower = index.lowered[i];
                const bool filters = contains(lower, "where") &&
                    (contains(lower, "=") || contains(lower, "in") || contains(lower, "like"));
                if (filters && !contains(lower, "where id") && contains(lower, "execute")) {
                    out.push_back(performance_finding("Query might benefit from index", i + 1, snippet_of(lines[i]),
                                                      Severity::Medium,
                                                      "Consider adding database index on queried columns"));
                }
            }
        }

        void detect_select_star(const std::vector<std::string_view>& lines, std::vector<Finding>& out) {
            static const std::regex pattern(R"(select\s+\*\s+from)",
                                            std::regex::ECMAScript | std::regex::icase | std::regex::optimize);
            for (std::size_t i = 0; i < lines.size(); ++i) {
                if (matches(pattern, lines[i])) {
                    out.push_back(performance_finding("SELECT * fetches unnecessary data", i + 1, snippet_of(lines[i]),
                                                      Severity::Medium,
                                                      "Specify only needed columns instead of SELECT *"));
                }
            }
        }

        void detect_nested_loops(const std::vector<std::string_view>& lines, const LineIndex& index,
                                 std::vector<Finding>& out) {
            std::vector<std::pair<std::size_t, std::size_t>> loops;  // (line, indentation)

            for (std::size_t i = 0; i < lines.size(); ++i) {
                if (!index.opens_loop[i]) {
                    continue;
                }
                const std::size_t line_num = i + 1;
                const std::size_t indent = string_utils::leading_whitespace(lines[i]);

                const bool nested = std::ranges::any_of(loops, [&](const auto& loop) {
                    return indent > loop.second &&
                           line_num - loop.first < PerformanceAnalyzer::NESTED_LOOP_DISTANCE;
                });
                if (nested) {
                    out.push_back(performance_finding("Nested loop detected (O(n²) complexity)", line_num,
                                                      snippet_of(lines[i]), Severity::Medium,
                                                      "Consider using set/dict lookup or algorithm optimization"));
                }

                loops.emplace_back(line_num, indent);
            }
        }

        void detect_connection_churn(const LineIndex& index, std::vector<Finding>& out) {
            const auto opens = static_cast<std::size_t>(std::ranges::count_if(index.lowered, [](const std::string& lower) {
                return contains(lower, "connect(");
            }));

            if (opens > 1) {
                const auto count = std::to_string(opens);
                out.push_back(performance_finding("Multiple connection calls detected (" + count + ")", 1,
                                                  "Found " + count + " separate connection calls",
                                                  Severity::High,
                                                  "Use connection pooling or context manager to reuse connections"));
            }
        }

        void detect_fetchall(const std::vector<std::string_view>& lines, const LineIndex& index,
                             std::vector<Finding>& out) {
            for (std::size_t i = 0; i < lines.size(); ++i) {
                if (contains(index.lowered[i], "fetchall()")) {
                    out.push_back(performance_finding("fetchall() loads all rows into memory", i + 1,
                                                      snippet_of(lines[i]), Severity::Medium,
                                                      "Use pagination (LIMIT/OFFSET) or fetchmany() for large datasets"));
                }
            }
        }

        void detect_string_concatenation(const std::vector<std::string_view>& lines, const LineIndex& index,
                                         std::vector<Finding>& out) {
            for (std::size_t i = 0; i < lines.size(); ++i) {
                if (!contains(lines[i], "+=")) {
                    continue;
                }
                const bool stringy = contains(index.lowered[i], "str") ||
                                     contains(lines[i], "\"") || contains(lines[i], "'");
                if (stringy && index.loop_above(i, PerformanceAnalyzer::CONCATENATION_WINDOW)) {
                    out.push_back(performance_finding("String concatenation in loop", i + 1, snippet_of(lines[i]),
                                                      Severity::Low,
                                                      R"(Use list.append() then "".join() for better performance)"));
                }
            }
        }

        void detect_append_in_loop(const std::vector<std::string_view>& lines, const LineIndex& index,
                                   std::vector<Finding>& out) {
            for (std::size_t i = 0; i < lines.size(); ++i) {
                if (contains(lines[i], ".append(") && index.loop_above(i, PerformanceAnalyzer::APPEND_WINDOW)) {
                    out.push_back(performance_finding("Consider list comprehension", i + 1, snippet_of(lines[i]),
                                                      Severity::Low,
                                                      "List comprehensions are faster than append in loops"));
                }
            }
        }

    }  // namespace

    std::vector<Finding> PerformanceAnalyzer::detect(const std::vector<std::string_view>& lines,
                                                     std::string_view /*text*/,
                                                     std::string_view /*filename*/) const {
        const LineIndex index(lines);

        std::vector<Finding> findings;
        detect_n_plus_one(lines, index, findings);
        detect_missing_index(lines, index, findings);
        detect_select_star(lines, findings);
        detect_nested_loops(lines, index, findings);
        detect_connection_churn(index, findings);
        detect_fetchall(lines, index, findings);
        detect_string_concatenation(lines, index, findings);
        detect_append_in_loop(lines, index, findings);
        return findings;
    }

}  // namespace cca::analyzers

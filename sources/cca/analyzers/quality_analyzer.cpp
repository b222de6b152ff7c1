//
// Created by gregorian-rayne on 2/11/26.
//

#include "cca/analyzers/quality_analyzer.hpp"
#include "cca/analyzers/rules.hpp"
#include "cca/utils/string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <regex>
#include <unordered_map>

namespace cca::analyzers
{
    namespace {

        using LineMatch = std::match_results<std::string_view::const_iterator>;

        std::optional<std::string> definition_name(const std::string_view line) {
            static const std::regex pattern(R"(^\s*(?:async\s+)?def\s+(\w+)\s*\()",
                                            std::regex::ECMAScript | std::regex::optimize);
            const auto window = match_window(line);
            LineMatch match;
            if (std::regex_search(window.begin(), window.end(), match, pattern)) {
                return match[1].str();
            }
            return std::nullopt;
        }

        bool starts_at_column_zero(const std::string_view line) noexcept {
            return !line.empty() && !std::isspace(static_cast<unsigned char>(line.front()));
        }

        void detect_long_functions(const std::vector<std::string_view>& lines, std::vector<Finding>& out) {
            std::optional<std::string> current;
            std::size_t start = 0;

            const auto close = [&](const std::size_t end_line) {
                if (const std::size_t length = end_line - start; length > QualityAnalyzer::MAX_FUNCTION_LENGTH) {
                    out.push_back(make_finding(Category::Quality,
                                               "Long function: " + *current + "()",
                                               start,
                                               "Function is " + std::to_string(length) + " lines long",
                                               Severity::Medium,
                                               "Break into smaller, focused functions"));
                }
                current.reset();
            };

            for (std::size_t i = 0; i < lines.size(); ++i) {
                const std::size_t line_num = i + 1;
                if (auto name = definition_name(lines[i])) {
                    // A new definition restarts tracking; the open one is dropped.
                    current = std::move(name);
                    start = line_num;
                } else if (current && starts_at_column_zero(lines[i])) {
                    close(line_num);
                }
            }

            if (current) {
                close(lines.size() + 1);
            }
        }

        void detect_long_lines(const std::vector<std::string_view>& lines, std::vector<Finding>& out) {
            for (std::size_t i = 0; i < lines.size(); ++i) {
                if (lines[i].size() > QualityAnalyzer::MAX_LINE_LENGTH) {
                    out.push_back(make_finding(Category::Quality,
                                               "Line too long",
                                               i + 1,
                                               std::string(string_utils::utf8_prefix(lines[i], QualityAnalyzer::LONG_LINE_PREVIEW)) + "...",
                                               Severity::Low,
                                               "Break into multiple lines (PEP 8: max 79-120 chars)"));
                }
            }
        }

        void detect_missing_docstrings(const std::vector<std::string_view>& lines, std::vector<Finding>& out) {
            for (std::size_t i = 0; i < lines.size(); ++i) {
                if (!definition_name(lines[i])) {
                    continue;
                }

                bool has_docstring = false;
                const std::size_t window_end = std::min(lines.size(), i + 1 + QualityAnalyzer::DOCSTRING_WINDOW);
                for (std::size_t j = i + 1; j < window_end; ++j) {
                    if (string_utils::contains(lines[j], R"(""")") || string_utils::contains(lines[j], "'''")) {
                        has_docstring = true;
                        break;
                    }
                }

                if (!has_docstring) {
                    out.push_back(make_finding(Category::Quality,
                                               "Missing docstring",
                                               i + 1,
                                               snippet_of(lines[i]),
                                               Severity::Low,
                                               "Add docstring to explain function purpose"));
                }
            }
        }

        void detect_duplicates(const std::vector<std::string_view>& lines, std::vector<Finding>& out) {
            struct Occurrence {
                std::string_view text;
                std::size_t first_line = 0;
                std::size_t count = 0;
            };

            std::vector<Occurrence> occurrences;
            std::unordered_map<std::string_view, std::size_t> index;

            for (std::size_t i = 0; i < lines.size(); ++i) {
                const auto stripped = string_utils::trim(lines[i]);
                if (stripped.size() <= QualityAnalyzer::MIN_DUPLICATE_LENGTH || is_comment_line(stripped)) {
                    continue;
                }

                if (const auto it = index.find(stripped); it != index.end()) {
                    ++occurrences[it->second].count;
                } else {
                    index.emplace(stripped, occurrences.size());
                    occurrences.push_back({stripped, i + 1, 1});
                }
            }

            for (const auto& [text, first_line, count] : occurrences) {
                if (count < QualityAnalyzer::MIN_DUPLICATE_COUNT) {
                    continue;
                }
                out.push_back(make_finding(Category::Quality,
                                           "Duplicate code detected",
                                           first_line,
                                           "Repeated " + std::to_string(count) + " times: " +
                                               std::string(string_utils::utf8_prefix(text, QualityAnalyzer::DUPLICATE_PREVIEW)) + "...",
                                           Severity::Medium,
                                           "Extract into a reusable function"));
            }
        }

    }  // namespace

    std::vector<Finding> QualityAnalyzer::detect(const std::vector<std::string_view>& lines,
                                                 std::string_view /*text*/,
                                                 std::string_view /*filename*/) const {
        std::vector<Finding> findings;
        detect_long_functions(lines, findings);
        detect_long_lines(lines, findings);
        detect_missing_docstrings(lines, findings);
        detect_duplicates(lines, findings);
        return findings;
    }

}  // namespace cca::analyzers

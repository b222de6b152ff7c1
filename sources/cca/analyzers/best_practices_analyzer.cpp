//
// Created by gregorian-rayne on 2/11/26.
//

#include "cca/analyzers/best_practices_analyzer.hpp"
#include "cca/analyzers/rules.hpp"
#include "cca/utils/string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <optional>
#include <regex>

namespace cca::analyzers
{
    const char* to_string(const Language language) noexcept {
        switch (language) {
            case Language::Python:     return "python";
            case Language::JavaScript: return "javascript";
            case Language::TypeScript: return "typescript";
            case Language::Java:       return "java";
            case Language::Go:         return "go";
            case Language::Ruby:       return "ruby";
            case Language::Cpp:        return "cpp";
            case Language::C:          return "c";
            case Language::Unknown:    return "unknown";
        }
        return "unknown";
    }

    namespace {

        using string_utils::contains;
        using string_utils::starts_with;
        using LineMatch = std::match_results<std::string_view::const_iterator>;

        constexpr auto REGEX_FLAGS = std::regex::ECMAScript | std::regex::optimize;

        Finding practice_finding(std::string issue, const std::size_t line, const std::string_view snippet,
                                 const Severity severity, std::string remediation) {
            return make_finding(Category::BestPractices, std::move(issue), line, snippet, severity,
                                std::move(remediation));
        }

        // ---------------------------------------------------------------------
        // Python
        // ---------------------------------------------------------------------

        struct PythonRules {
            std::regex bare_except{R"(^\s*except\s*:)", REGEX_FLAGS};
            std::regex mutable_default{R"(=\s*\[\s*\]|=\s*\{\s*\})", REGEX_FLAGS};
            std::regex lambda_assignment{R"(^\s*\w+\s*=\s*lambda\s)", REGEX_FLAGS};
            std::regex type_comparison{R"(type\s*\([^)]+\)\s*==)", REGEX_FLAGS};
            std::regex boolean_comparison{R"(==\s*(True|False)\b)", REGEX_FLAGS};
            std::regex len_conditional{R"(if\s+len\s*\([^)]+\)\s*[><=])", REGEX_FLAGS};
            std::regex wildcard_import{R"(from\s+\w+\s+import\s+\*)", REGEX_FLAGS};
        };

        const PythonRules& python_rules() {
            static const PythonRules rules;
            return rules;
        }

        void check_python(const std::vector<std::string_view>& lines, const std::string_view text,
                          std::vector<Finding>& out) {
            const auto& rules = python_rules();
            const bool has_main_guard = contains(text, "__main__");

            for (std::size_t i = 0; i < lines.size(); ++i) {
                const std::size_t line_num = i + 1;
                const auto stripped = string_utils::trim(lines[i]);
                const bool commented = starts_with(stripped, "#");
                const auto snippet = snippet_of(stripped);

                if (contains(stripped, "print(") && !commented && !has_main_guard &&
                    !contains(string_utils::to_lower(stripped), "debug")) {
                    out.push_back(practice_finding("Print statement in production code", line_num, snippet,
                                                   Severity::Low,
                                                   "Use logging module instead of print() for production code"));
                }

                if (matches(rules.bare_except, stripped)) {
                    out.push_back(practice_finding("Bare except clause catches all exceptions", line_num, snippet,
                                                   Severity::Medium,
                                                   "Specify exception types (e.g., except ValueError:) or use except Exception:"));
                }

                if (contains(stripped, "def ") && contains(stripped, "=") && matches(rules.mutable_default, stripped)) {
                    out.push_back(practice_finding("Mutable default argument", line_num, snippet, Severity::High,
                                                   "Use None as default and initialize inside function: "
                                                   "def func(arg=None): arg = arg or []"));
                }

                if (stripped == "pass" && line_num > 1) {
                    const auto previous = string_utils::trim(lines[i - 1]);
                    if (!contains(previous, "except") && !contains(previous, "class")) {
                        out.push_back(practice_finding("Unnecessary pass statement", line_num, snippet, Severity::Low,
                                                       "Consider removing or adding a comment explaining why it's empty"));
                    }
                }

                if (matches(rules.lambda_assignment, stripped)) {
                    out.push_back(practice_finding("Lambda assignment should be a function", line_num, snippet,
                                                   Severity::Medium,
                                                   "Use def instead of assigning lambda to a variable"));
                }

                if (matches(rules.type_comparison, stripped)) {
                    out.push_back(practice_finding("Using type() for type checking", line_num, snippet,
                                                   Severity::Medium,
                                                   "Use isinstance() instead of type() == for type checking"));
                }

                if (matches(rules.boolean_comparison, stripped)) {
                    out.push_back(practice_finding("Explicit boolean comparison", line_num, snippet, Severity::Low,
                                                   R"(Use "if variable:" instead of "if variable == True:")"));
                }

                if (matches(rules.len_conditional, stripped)) {
                    out.push_back(practice_finding("Using len() in conditional", line_num, snippet, Severity::Low,
                                                   R"(Use "if collection:" instead of "if len(collection) > 0:")"));
                }

                if (matches(rules.wildcard_import, stripped)) {
                    out.push_back(practice_finding("Wildcard import", line_num, snippet, Severity::Medium,
                                                   R"(Import specific items or use "import module" instead of "from module import *")"));
                }

                if (contains(stripped, ";") && !commented) {
                    out.push_back(practice_finding("Multiple statements on one line", line_num, snippet,
                                                   Severity::Low,
                                                   "Put each statement on its own line for better readability"));
                }
            }
        }

        // ---------------------------------------------------------------------
        // General
        // ---------------------------------------------------------------------

        void check_todo_markers(const std::vector<std::string_view>& lines, std::vector<Finding>& out) {
            static const std::regex pattern(R"((#|//)\s*(TODO|FIXME|HACK|XXX))", REGEX_FLAGS | std::regex::icase);
            for (std::size_t i = 0; i < lines.size(); ++i) {
                if (matches(pattern, lines[i])) {
                    out.push_back(practice_finding("TODO/FIXME comment found", i + 1, snippet_of(lines[i]),
                                                   Severity::Low,
                                                   "Address the TODO or create a tracked issue for it"));
                }
            }
        }

        void check_magic_numbers(const std::vector<std::string_view>& lines, std::vector<Finding>& out) {
            static const std::regex pattern(R"(\b(?!0\b|1\b|-1\b)\d{2,}\b)", REGEX_FLAGS);
            for (std::size_t i = 0; i < lines.size(); ++i) {
                const auto code = lines[i].substr(0, lines[i].find('#'));
                if (matches(pattern, code) && !contains(code, "range") && !contains(code, "sleep")) {
                    out.push_back(practice_finding("Magic number detected", i + 1, snippet_of(code), Severity::Low,
                                                   "Define magic numbers as named constants for better maintainability"));
                }
            }
        }

        void check_nesting(const std::vector<std::string_view>& lines, std::vector<Finding>& out) {
            for (std::size_t i = 0; i < lines.size(); ++i) {
                if (string_utils::trim(lines[i]).empty()) {
                    continue;
                }
                const std::size_t level = string_utils::leading_whitespace(lines[i]) / BestPracticesAnalyzer::INDENT_WIDTH;
                if (level > BestPracticesAnalyzer::MAX_NESTING_LEVEL) {
                    out.push_back(practice_finding("Deeply nested code (" + std::to_string(level) + " levels)", i + 1,
                                                   snippet_of(lines[i]), Severity::Medium,
                                                   "Refactor to reduce nesting (extract methods, use early returns)"));
                    return;
                }
            }
        }

        void check_commented_code(const std::vector<std::string_view>& lines, std::vector<Finding>& out) {
            static const std::regex code_like(R"([=+\-*/(){}\[\]]|def |class |import |if |for |while )", REGEX_FLAGS);

            std::size_t run = 0;
            for (std::size_t i = 0; i < lines.size(); ++i) {
                const auto stripped = string_utils::trim(lines[i]);
                if (is_comment_line(stripped) && stripped.size() > 3) {
                    const auto body = stripped.substr(starts_with(stripped, "//") ? 2 : 1);
                    run = matches(code_like, body) ? run + 1 : 0;
                } else {
                    run = 0;
                }

                if (run >= BestPracticesAnalyzer::COMMENTED_CODE_RUN) {
                    out.push_back(practice_finding("Large block of commented-out code",
                                                   i + 2 - BestPracticesAnalyzer::COMMENTED_CODE_RUN,
                                                   "Multiple lines of commented code", Severity::Low,
                                                   "Remove commented code (use version control instead)"));
                    return;
                }
            }
        }

        std::size_t count_matches(const std::vector<std::string_view>& lines, const std::regex& pattern) {
            using Iterator = std::regex_iterator<std::string_view::const_iterator>;
            std::size_t count = 0;
            for (const auto line : lines) {
                const auto window = match_window(line);
                count += static_cast<std::size_t>(std::distance(Iterator(window.begin(), window.end(), pattern),
                                                                Iterator()));
            }
            return count;
        }

        // Identifiers never span lines, so counting per line equals counting the whole text.
        void check_naming(const std::vector<std::string_view>& lines, std::vector<Finding>& out) {
            static const std::regex camel_case(R"(\b[a-z]+[A-Z][a-zA-Z]*\b)", REGEX_FLAGS);
            static const std::regex snake_case(R"(\b[a-z]+_[a-z]+\b)", REGEX_FLAGS);

            const std::size_t camel = count_matches(lines, camel_case);
            const std::size_t snake = count_matches(lines, snake_case);

            if (std::min(camel, snake) > BestPracticesAnalyzer::NAMING_THRESHOLD) {
                out.push_back(practice_finding("Inconsistent naming convention", 1,
                                               "Mixed camelCase (" + std::to_string(camel) + ") and snake_case (" +
                                                   std::to_string(snake) + ")",
                                               Severity::Low,
                                               "Use consistent naming convention throughout (Python: snake_case)"));
            }
        }

        void check_long_definitions(const std::vector<std::string_view>& lines, std::vector<Finding>& out) {
            static const std::regex definition(R"(^\s*(?:async\s+)?def\s+(\w+))", REGEX_FLAGS);

            std::optional<std::string> current;
            std::size_t start = 0;

            const auto close = [&](const std::size_t end_line) {
                if (const std::size_t length = end_line - start; length > BestPracticesAnalyzer::MAX_DEFINITION_LENGTH) {
                    out.push_back(practice_finding("Function \"" + *current + "\" is very long (" +
                                                       std::to_string(length) + " lines)",
                                                   1, "Function exceeds 100 lines", Severity::Medium,
                                                   "Break down into smaller, focused functions following "
                                                   "Single Responsibility Principle"));
                }
                current.reset();
            };

            for (std::size_t i = 0; i < lines.size(); ++i) {
                const auto line = lines[i];
                const auto window = match_window(line);
                const std::size_t line_num = i + 1;

                if (LineMatch match; std::regex_search(window.begin(), window.end(), match, definition)) {
                    if (current) {
                        close(line_num);
                    }
                    current = match[1].str();
                    start = line_num;
                } else if (current && !line.empty() && !std::isspace(static_cast<unsigned char>(line.front())) &&
                           !contains(line, "def ")) {
                    close(line_num);
                }
            }

            if (current) {
                close(lines.size() + 1);
            }
        }

    }  // namespace

    Language BestPracticesAnalyzer::detect_language(const std::string_view filename) {
        const auto dot = filename.rfind('.');
        const auto extension = string_utils::to_lower(dot == std::string_view::npos ? filename : filename.substr(dot + 1));

        if (extension == "py") return Language::Python;
        if (extension == "js") return Language::JavaScript;
        if (extension == "ts") return Language::TypeScript;
        if (extension == "java") return Language::Java;
        if (extension == "go") return Language::Go;
        if (extension == "rb") return Language::Ruby;
        if (extension == "cpp") return Language::Cpp;
        if (extension == "c") return Language::C;
        return Language::Unknown;
    }

    std::vector<Finding> BestPracticesAnalyzer::detect(const std::vector<std::string_view>& lines,
                                                       const std::string_view text,
                                                       const std::string_view filename) const {
        std::vector<Finding> findings;

        if (detect_language(filename) == Language::Python) {
            check_python(lines, text, findings);
        }

        check_todo_markers(lines, findings);
        check_magic_numbers(lines, findings);
        check_nesting(lines, findings);
        check_commented_code(lines, findings);
        check_naming(lines, findings);
        check_long_definitions(lines, findings);
        return findings;
    }

}  // namespace cca::analyzers

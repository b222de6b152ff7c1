//
// Created by gregorian-rayne on 2/11/26.
//

#include "cca/analyzers/security_analyzer.hpp"
#include "cca/analyzers/rules.hpp"

#include <algorithm>
#include <cctype>

namespace cca::analyzers
{
    namespace {

        constexpr auto SECRET_FIX = "Use environment variables or secret management system";
        constexpr auto INJECTION_FIX = "Use parameterized queries with placeholders";

        const std::vector<LineRule>& secret_rules() {
            static const std::vector<LineRule> rules = {
                make_rule(R"(password\s*=\s*["']([^"']+)["'])", "Hardcoded password", Severity::High, SECRET_FIX, true),
                make_rule(R"(api[_-]?key\s*=\s*["']([^"']+)["'])", "Hardcoded API key", Severity::High, SECRET_FIX, true),
                make_rule(R"(secret\s*=\s*["']([^"']+)["'])", "Hardcoded secret", Severity::High, SECRET_FIX, true),
                make_rule(R"(token\s*=\s*["']([^"']+)["'])", "Hardcoded token", Severity::High, SECRET_FIX, true),
                make_rule(R"(aws[_-]?access[_-]?key)", "AWS credentials", Severity::High, SECRET_FIX, true),
            };
            return rules;
        }

        /**
         * execute( followed by a '+' with text on both sides and a ')' after
         * it. Scanned rather than matched, so the line length is unbounded.
         */
        bool concatenated_execute(const std::string_view line) {
            constexpr std::string_view call = "execute";
            const auto body_end = std::min(line.find_first_of("\r\n"), line.size());
            const auto body = line.substr(0, body_end);

            for (auto at = body.find(call); at != std::string_view::npos; at = body.find(call, at + 1)) {
                std::size_t pos = at + call.size();
                while (pos < body.size() && std::isspace(static_cast<unsigned char>(body[pos]))) {
                    ++pos;
                }
                if (pos >= body.size() || body[pos] != '(') {
                    continue;
                }
                const auto args = body.substr(pos + 1);
                const auto plus = args.find('+', 1);
                if (plus == std::string_view::npos) {
                    continue;
                }
                const auto close = args.rfind(')');
                if (close != std::string_view::npos && close >= plus + 2) {
                    return true;
                }
            }
            return false;
        }

        // Case-sensitive: "EXECUTE" in a SQL string literal is not a call.
        const std::vector<LineRule>& injection_rules() {
            static const std::vector<LineRule> rules = {
                make_rule(R"(execute\s*\(\s*f["'].*\{.*\}.*["'])", "SQL injection via f-string", Severity::Critical, INJECTION_FIX),
                make_rule(R"(execute\s*\(\s*["'].*%s.*["'].*%)", "SQL injection via string formatting", Severity::Critical, INJECTION_FIX),
                make_scan_rule(concatenated_execute, "SQL injection via concatenation", Severity::Critical, INJECTION_FIX),
                make_rule(R"(cursor\.execute\s*\([^,]+\+)", "SQL injection in cursor.execute", Severity::Critical, INJECTION_FIX),
            };
            return rules;
        }

        LineRule dangerous_call_rule(const std::string& function) {
            const std::string pattern = "\\b" + function + "\\s*\\(";
            return make_rule(pattern.c_str(),
                             "Dangerous function: " + function + "()",
                             Severity::High,
                             "Avoid using " + function + "() - find safer alternatives");
        }

        const std::vector<LineRule>& dynamic_evaluation_rules() {
            static const std::vector<LineRule> rules = {
                dangerous_call_rule("eval"),
                dangerous_call_rule("exec"),
                dangerous_call_rule("__import__"),
            };
            return rules;
        }

    }  // namespace

    std::vector<Finding> SecurityAnalyzer::detect(const std::vector<std::string_view>& lines,
                                                  std::string_view /*text*/,
                                                  std::string_view /*filename*/) const {
        std::vector<Finding> findings;
        apply_line_rules(category(), secret_rules(), lines, findings);
        apply_line_rules(category(), injection_rules(), lines, findings);
        apply_line_rules(category(), dynamic_evaluation_rules(), lines, findings);
        return findings;
    }

}  // namespace cca::analyzers

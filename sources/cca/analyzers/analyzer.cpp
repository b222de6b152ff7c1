//
// Created by gregorian-rayne on 2/11/26.
//

#include "cca/analyzers/analyzer.hpp"
#include "cca/analyzers/rules.hpp"

namespace cca::analyzers
{
    Result<std::vector<Finding>> IAnalyzer::analyze(const std::string_view text,
                                                    const std::string_view filename) const {
        if (const auto pos = text.find('\0'); pos != std::string_view::npos) {
            return Result<std::vector<Finding>>::failure(Error::analysis_error(
                "Input contains a NUL byte at offset " + std::to_string(pos),
                std::string(name()) + ": " + std::string(filename)));
        }

        const auto lines = split_lines(text);
        return Result<std::vector<Finding>>::success(detect(lines, text, filename));
    }

    Result<std::size_t> IAnalyzer::persist(const std::vector<Finding>& findings,
                                           const SubmissionId submission_id) const {
        if (!store_) {
            return Result<std::size_t>::failure(Error::store_error(
                "Analyzer has no store", std::string(name())));
        }

        std::vector<storage::FindingRow> rows;
        rows.reserve(findings.size());
        for (const auto& finding : findings) {
            rows.push_back(storage::to_row(finding, submission_id));
        }

        const std::string table = findings_table(category());
        return store_->ensure_schema(storage::findings_table_schema(table))
            .and_then([&] { return store_->insert(table, rows); })
            .with_context(std::string(name()));
    }

}  // namespace cca::analyzers

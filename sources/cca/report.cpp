//
// Created by gregorian-rayne on 2/12/26.
//

#include "cca/report.hpp"

#include <chrono>

namespace cca::report {

    Result<Report> load_report(storage::IFindingStore& store, const SubmissionId id) {
        auto submission = store.get_submission(id);
        if (submission.is_err()) {
            return Result<Report>::failure(submission.error());
        }

        auto rows = store.query_findings(storage::MERGED_FINDINGS_TABLE, id);
        if (rows.is_err()) {
            return Result<Report>::failure(rows.error());
        }

        Report report;
        report.submission_id = id;
        report.filename = submission.value().filename;

        for (const auto& row : rows.value()) {
            auto finding = storage::to_finding(row);
            if (finding.is_err()) {
                return Result<Report>::failure(finding.error().with_context(
                    "submission " + std::to_string(id)));
            }
            auto& category = report.at(finding.value().category);
            category.findings.push_back(std::move(finding).value());
            ++category.count;
        }

        return Result<Report>::success(std::move(report));
    }

    nlohmann::json finding_to_json(const Finding& finding) {
        nlohmann::json j;
        j["category"] = to_string(finding.category);
        j["issue"] = finding.issue;
        j["line"] = finding.line;
        j["snippet"] = finding.snippet;
        j["severity"] = to_string(finding.severity);
        j["remediation"] = finding.remediation;
        return j;
    }

    nlohmann::json report_to_json(const Report& report) {
        nlohmann::json j;
        j["submission_id"] = report.submission_id;
        j["filename"] = report.filename;
        j["mode"] = to_string(report.mode);
        j["total_issues"] = report.total_issues();

        nlohmann::json categories = nlohmann::json::object();
        for (const auto category : ALL_CATEGORIES) {
            const auto& section = report.at(category);
            nlohmann::json findings = nlohmann::json::array();
            for (const auto& finding : section.findings) {
                findings.push_back(finding_to_json(finding));
            }
            categories[to_string(category)] = {
                {"count", section.count},
                {"findings", std::move(findings)}
            };
        }
        j["categories"] = std::move(categories);

        nlohmann::json failures = nlohmann::json::array();
        for (const auto& [category, error] : report.failures) {
            failures.push_back({
                {"category", to_string(category)},
                {"error", error.to_string()}
            });
        }
        j["failures"] = std::move(failures);

        return j;
    }

    nlohmann::json submission_to_json(const Submission& submission, const bool include_content) {
        nlohmann::json j;
        j["id"] = submission.id;
        j["filename"] = submission.filename;
        j["uploaded_at"] = std::chrono::duration_cast<std::chrono::seconds>(
            submission.created_at.time_since_epoch()).count();
        j["size"] = submission.content.size();
        if (include_content) {
            j["content"] = submission.content;
        }
        return j;
    }

    std::string dump_json(const nlohmann::json& document) {
        return document.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
    }

}  // namespace cca::report

//
// Created by gregorian-rayne on 2/10/26.
//

#include "cca/storage/finding_store.hpp"
#include "cca/storage/sqlite_store.hpp"
#include "cca/storage/store_url.hpp"
#include "cca/logging.hpp"

#include <cctype>

namespace cca::storage {

    TableSchema findings_table_schema(const std::string& table_name) {
        return TableSchema{
            table_name,
            {
                {"id", "INTEGER PRIMARY KEY AUTOINCREMENT"},
                {"submission_id", "INTEGER"},
                {"issue_type", "TEXT"},
                {"line_number", "INTEGER"},
                {"severity", "TEXT"},
                {"description", "TEXT"},
                {"suggested_fix", "TEXT"},
                {"created_at", "TIMESTAMP DEFAULT CURRENT_TIMESTAMP"}
            }
        };
    }

    TableSchema merged_findings_schema() {
        auto schema = findings_table_schema(MERGED_FINDINGS_TABLE);
        schema.columns.insert(schema.columns.begin() + 2, ColumnDef{"agent_type", "TEXT"});
        return schema;
    }

    bool is_valid_identifier(const std::string_view name) noexcept {
        if (name.empty()) {
            return false;
        }
        const auto first = static_cast<unsigned char>(name.front());
        if (!std::isalpha(first) && first != '_') {
            return false;
        }
        for (const char c : name) {
            if (const auto u = static_cast<unsigned char>(c); !std::isalnum(u) && u != '_') {
                return false;
            }
        }
        return true;
    }

    FindingRow to_row(const Finding& finding, const SubmissionId submission_id, const bool tag_with_category) {
        FindingRow row;
        row.submission_id = submission_id;
        row.issue_type = finding.issue;
        row.line_number = finding.line;
        row.severity = to_string(finding.severity);
        row.description = finding.snippet;
        row.suggested_fix = finding.remediation;
        if (tag_with_category) {
            row.agent_type = to_string(finding.category);
        }
        return row;
    }

    Result<Finding> to_finding(const FindingRow& row, const std::optional<Category> fallback) {
        std::optional<Category> category = fallback;
        if (row.agent_type) {
            category = category_from_string(*row.agent_type);
            if (!category) {
                return Result<Finding>::failure(Error::parse_error(
                    "Unknown agent type '" + *row.agent_type + "'"));
            }
        }
        if (!category) {
            return Result<Finding>::failure(Error::invalid_argument(
                "Finding row has no category"));
        }

        const auto severity = severity_from_string(row.severity);
        if (!severity) {
            return Result<Finding>::failure(Error::parse_error(
                "Unknown severity '" + row.severity + "'"));
        }

        Finding finding;
        finding.category = *category;
        finding.issue = row.issue_type;
        finding.line = row.line_number;
        finding.snippet = row.description;
        finding.severity = *severity;
        finding.remediation = row.suggested_fix;
        return Result<Finding>::success(std::move(finding));
    }

    namespace {
        Result<StorePtr> open_sqlite(const std::string& url, const OpenMode mode) {
            auto location = parse_store_url(url);
            if (location.is_err()) {
                return Result<StorePtr>::failure(location.error());
            }

            const bool in_memory = location.value().path == ":memory:";
            auto store = std::make_shared<SQLiteStore>(location.value().path, location.value().url);
            if (auto init = store->initialize(in_memory ? OpenMode::Create : mode); init.is_err()) {
                return Result<StorePtr>::failure(init.error());
            }

            CCA_LOG_DEBUG("Opened store {}", location.value().url);
            return Result<StorePtr>::success(std::move(store));
        }
    }

    Result<StorePtr> open_store(const std::string& url) {
        return open_sqlite(url, OpenMode::Create);
    }

    Result<StorePtr> open_existing_store(const std::string& url) {
        return open_sqlite(url, OpenMode::ExistingOnly);
    }

}  // namespace cca::storage

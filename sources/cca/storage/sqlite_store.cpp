//
// Created by gregorian-rayne on 2/10/26.
//

#include "cca/storage/sqlite_store.hpp"

#include <chrono>
#include <utility>

namespace cca::storage {

    namespace Schema {
        auto SUBMISSIONS_SQL = R"(
            CREATE TABLE IF NOT EXISTS code_submissions (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                filename TEXT,
                code_content TEXT,
                uploaded_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP
            );
        )";

        constexpr int BUSY_TIMEOUT_MS = 5000;
    }

    namespace {
        std::string column_string(sqlite3_stmt* stmt, const int column) {
            const auto* text = sqlite3_column_text(stmt, column);
            if (!text) {
                return {};
            }
            return {reinterpret_cast<const char*>(text),
                    static_cast<std::size_t>(sqlite3_column_bytes(stmt, column))};
        }

        Submission read_submission(sqlite3_stmt* stmt) {
            Submission submission;
            submission.id = sqlite3_column_int64(stmt, 0);
            submission.filename = column_string(stmt, 1);
            submission.content = column_string(stmt, 2);
            submission.created_at = Timestamp(std::chrono::seconds(sqlite3_column_int64(stmt, 3)));
            return submission;
        }

        std::string create_table_sql(const TableSchema& schema) {
            std::string sql = "CREATE TABLE IF NOT EXISTS " + schema.name + " (";
            for (std::size_t i = 0; i < schema.columns.size(); ++i) {
                if (i > 0) {
                    sql += ", ";
                }
                sql += schema.columns[i].name + " " + schema.columns[i].type;
            }
            sql += ")";
            return sql;
        }
    }

    SQLiteStore::SQLiteStore(std::string db_path, std::string url)
        : db_path_(std::move(db_path))
        , url_(std::move(url)) {
        if (url_.empty()) {
            url_ = db_path_;
        }
    }

    SQLiteStore::~SQLiteStore() {
        if (db_) {
            sqlite3_close(db_);
        }
    }

    Result<void> SQLiteStore::initialize(const OpenMode mode) {
        std::scoped_lock lock(mutex_);

        if (db_) {
            return Result<void>::success();
        }

        const int flags = mode == OpenMode::Create
            ? SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE
            : SQLITE_OPEN_READWRITE;
        if (const int rc = sqlite3_open_v2(db_path_.c_str(), &db_, flags, nullptr); rc != SQLITE_OK) {
            const std::string error = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
            sqlite3_close(db_);
            db_ = nullptr;
            return Result<void>::failure(
                Error::store_error("Failed to open database: " + error, url_));
        }

        sqlite3_busy_timeout(db_, Schema::BUSY_TIMEOUT_MS);

        if (mode == OpenMode::ExistingOnly) {
            return Result<void>::success();
        }

        if (auto wal = exec("PRAGMA journal_mode = WAL"); wal.is_err()) {
            return wal;
        }

        return exec(Schema::SUBMISSIONS_SQL);
    }

    Result<void> SQLiteStore::close() {
        std::scoped_lock lock(mutex_);

        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }

        return Result<void>::success();
    }

    bool SQLiteStore::is_open() const {
        std::scoped_lock lock(mutex_);
        return db_ != nullptr;
    }

    std::string SQLiteStore::location() const {
        return url_;
    }

    Result<void> SQLiteStore::exec(const std::string& sql) const {
        char* error_msg = nullptr;
        if (const int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg); rc != SQLITE_OK) {
            const std::string error = error_msg ? error_msg : sqlite3_errstr(rc);
            sqlite3_free(error_msg);
            return Result<void>::failure(Error::store_error("SQL execution failed: " + error, url_));
        }
        return Result<void>::success();
    }

    Result<void> SQLiteStore::require_open() const {
        if (!db_) {
            return Result<void>::failure(Error::store_error("Store is not open", url_));
        }
        return Result<void>::success();
    }

    Error SQLiteStore::last_error(const std::string& what) const {
        return Error::store_error(what + ": " + std::string(sqlite3_errmsg(db_)), url_);
    }

    Result<bool> SQLiteStore::table_exists(const std::string& table) const {
        const auto sql = "SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = ?";

        sqlite3_stmt* stmt;
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return Result<bool>::failure(last_error("Failed to prepare statement"));
        }

        sqlite3_bind_text(stmt, 1, table.c_str(), -1, SQLITE_TRANSIENT);
        const int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);

        if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
            return Result<bool>::failure(last_error("Failed to inspect schema"));
        }
        return Result<bool>::success(rc == SQLITE_ROW);
    }

    Result<void> SQLiteStore::ensure_schema(const TableSchema& schema) {
        if (!is_valid_identifier(schema.name)) {
            return Result<void>::failure(Error::invalid_argument(
                "Invalid table name '" + schema.name + "'", url_));
        }
        if (schema.columns.empty()) {
            return Result<void>::failure(Error::invalid_argument(
                "Table schema has no columns", schema.name));
        }
        for (const auto& column : schema.columns) {
            if (!is_valid_identifier(column.name)) {
                return Result<void>::failure(Error::invalid_argument(
                    "Invalid column name '" + column.name + "'", schema.name));
            }
        }

        std::scoped_lock lock(mutex_);
        if (auto open = require_open(); open.is_err()) {
            return open;
        }

        if (auto created = exec(create_table_sql(schema)); created.is_err()) {
            return Result<void>::failure(created.error().with_context("table " + schema.name));
        }
        return Result<void>::success();
    }

    Result<std::size_t> SQLiteStore::insert(const std::string& table, const std::vector<FindingRow>& rows) {
        if (!is_valid_identifier(table)) {
            return Result<std::size_t>::failure(Error::invalid_argument(
                "Invalid table name '" + table + "'", url_));
        }
        if (rows.empty()) {
            return Result<std::size_t>::success(0);
        }

        std::scoped_lock lock(mutex_);
        if (auto open = require_open(); open.is_err()) {
            return Result<std::size_t>::failure(open.error());
        }

        const bool tagged = rows.front().agent_type.has_value();
        const std::string sql = tagged
            ? "INSERT INTO " + table +
              " (submission_id, agent_type, issue_type, line_number, severity, description, suggested_fix)"
              " VALUES (?, ?, ?, ?, ?, ?, ?)"
            : "INSERT INTO " + table +
              " (submission_id, issue_type, line_number, severity, description, suggested_fix)"
              " VALUES (?, ?, ?, ?, ?, ?)";

        if (auto begin = exec("BEGIN IMMEDIATE"); begin.is_err()) {
            return Result<std::size_t>::failure(begin.error());
        }

        sqlite3_stmt* stmt;
        if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
            auto error = last_error("Failed to prepare insert into " + table);
            (void)exec("ROLLBACK");
            return Result<std::size_t>::failure(std::move(error));
        }

        std::size_t written = 0;
        for (const auto& row : rows) {
            if (row.agent_type.has_value() != tagged) {
                sqlite3_finalize(stmt);
                (void)exec("ROLLBACK");
                return Result<std::size_t>::failure(Error::invalid_argument(
                    "Cannot mix tagged and untagged rows in one batch", table));
            }

            int index = 1;
            sqlite3_bind_int64(stmt, index++, row.submission_id);
            if (tagged) {
                sqlite3_bind_text(stmt, index++, row.agent_type->c_str(), -1, SQLITE_TRANSIENT);
            }
            sqlite3_bind_text(stmt, index++, row.issue_type.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_int64(stmt, index++, static_cast<sqlite3_int64>(row.line_number));
            sqlite3_bind_text(stmt, index++, row.severity.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, index++, row.description.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, index, row.suggested_fix.c_str(), -1, SQLITE_TRANSIENT);

            if (sqlite3_step(stmt) != SQLITE_DONE) {
                auto error = last_error("Failed to insert into " + table);
                sqlite3_finalize(stmt);
                (void)exec("ROLLBACK");
                return Result<std::size_t>::failure(std::move(error));
            }

            sqlite3_reset(stmt);
            sqlite3_clear_bindings(stmt);
            ++written;
        }

        sqlite3_finalize(stmt);

        if (auto commit = exec("COMMIT"); commit.is_err()) {
            (void)exec("ROLLBACK");
            return Result<std::size_t>::failure(commit.error());
        }

        return Result<std::size_t>::success(written);
    }

    Result<SubmissionId> SQLiteStore::new_submission_id(const std::string& filename, const std::string& content) {
        std::scoped_lock lock(mutex_);
        if (auto open = require_open(); open.is_err()) {
            return Result<SubmissionId>::failure(open.error());
        }

        const auto sql = "INSERT INTO code_submissions (filename, code_content) VALUES (?, ?)";

        sqlite3_stmt* stmt;
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return Result<SubmissionId>::failure(last_error("Failed to prepare statement"));
        }

        sqlite3_bind_text(stmt, 1, filename.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, content.data(), static_cast<int>(content.size()), SQLITE_TRANSIENT);

        const int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);

        if (rc != SQLITE_DONE) {
            return Result<SubmissionId>::failure(last_error("Failed to insert submission"));
        }

        return Result<SubmissionId>::success(sqlite3_last_insert_rowid(db_));
    }

    Result<Submission> SQLiteStore::get_submission(const SubmissionId id) {
        std::scoped_lock lock(mutex_);
        if (auto open = require_open(); open.is_err()) {
            return Result<Submission>::failure(open.error());
        }

        const auto sql =
            "SELECT id, filename, code_content, CAST(strftime('%s', uploaded_at) AS INTEGER) "
            "FROM code_submissions WHERE id = ?";

        sqlite3_stmt* stmt;
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return Result<Submission>::failure(last_error("Failed to prepare statement"));
        }

        sqlite3_bind_int64(stmt, 1, id);

        const int rc = sqlite3_step(stmt);
        if (rc == SQLITE_DONE) {
            sqlite3_finalize(stmt);
            return Result<Submission>::failure(Error::not_found(
                "Submission " + std::to_string(id) + " not found", url_));
        }
        if (rc != SQLITE_ROW) {
            auto error = last_error("Failed to query submission");
            sqlite3_finalize(stmt);
            return Result<Submission>::failure(std::move(error));
        }

        auto submission = read_submission(stmt);
        sqlite3_finalize(stmt);
        return Result<Submission>::success(std::move(submission));
    }

    Result<std::vector<Submission>> SQLiteStore::list_submissions(const std::size_t limit) {
        std::scoped_lock lock(mutex_);
        if (auto open = require_open(); open.is_err()) {
            return Result<std::vector<Submission>>::failure(open.error());
        }

        const auto sql =
            "SELECT id, filename, code_content, CAST(strftime('%s', uploaded_at) AS INTEGER) "
            "FROM code_submissions ORDER BY id DESC LIMIT ?";

        sqlite3_stmt* stmt;
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return Result<std::vector<Submission>>::failure(last_error("Failed to prepare statement"));
        }

        sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(limit));

        std::vector<Submission> submissions;
        int rc;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
            submissions.push_back(read_submission(stmt));
        }
        sqlite3_finalize(stmt);

        if (rc != SQLITE_DONE) {
            return Result<std::vector<Submission>>::failure(last_error("Failed to list submissions"));
        }
        return Result<std::vector<Submission>>::success(std::move(submissions));
    }

    Result<std::vector<FindingRow>> SQLiteStore::query_findings(const std::string& table,
                                                                const SubmissionId submission_id) {
        if (!is_valid_identifier(table)) {
            return Result<std::vector<FindingRow>>::failure(Error::invalid_argument(
                "Invalid table name '" + table + "'", url_));
        }

        std::scoped_lock lock(mutex_);
        if (auto open = require_open(); open.is_err()) {
            return Result<std::vector<FindingRow>>::failure(open.error());
        }

        auto exists = table_exists(table);
        if (exists.is_err()) {
            return Result<std::vector<FindingRow>>::failure(exists.error());
        }
        if (!exists.value()) {
            return Result<std::vector<FindingRow>>::success({});
        }

        const std::string sql = "SELECT * FROM " + table + " WHERE submission_id = ? ORDER BY id";

        sqlite3_stmt* stmt;
        if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
            return Result<std::vector<FindingRow>>::failure(last_error("Failed to prepare statement"));
        }

        sqlite3_bind_int64(stmt, 1, submission_id);

        std::vector<FindingRow> rows;
        const int columns = sqlite3_column_count(stmt);
        int rc;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
            FindingRow row;
            for (int c = 0; c < columns; ++c) {
                const std::string_view name = sqlite3_column_name(stmt, c);
                if (name == "submission_id") {
                    row.submission_id = sqlite3_column_int64(stmt, c);
                } else if (name == "agent_type") {
                    row.agent_type = column_string(stmt, c);
                } else if (name == "issue_type") {
                    row.issue_type = column_string(stmt, c);
                } else if (name == "line_number") {
                    row.line_number = static_cast<std::size_t>(sqlite3_column_int64(stmt, c));
                } else if (name == "severity") {
                    row.severity = column_string(stmt, c);
                } else if (name == "description") {
                    row.description = column_string(stmt, c);
                } else if (name == "suggested_fix") {
                    row.suggested_fix = column_string(stmt, c);
                }
            }
            rows.push_back(std::move(row));
        }
        sqlite3_finalize(stmt);

        if (rc != SQLITE_DONE) {
            return Result<std::vector<FindingRow>>::failure(last_error("Failed to query " + table));
        }
        return Result<std::vector<FindingRow>>::success(std::move(rows));
    }

    Result<void> SQLiteStore::ping() {
        std::scoped_lock lock(mutex_);
        if (auto open = require_open(); open.is_err()) {
            return open;
        }
        // Reading the schema fails on a file that is not a database.
        return exec("SELECT count(*) FROM sqlite_master");
    }

}  // namespace cca::storage

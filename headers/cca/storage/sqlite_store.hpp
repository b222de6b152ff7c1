//
// Created by gregorian-rayne on 2/10/26.
//

#ifndef CCA_SQLITE_STORE_HPP
#define CCA_SQLITE_STORE_HPP

#include "cca/storage/finding_store.hpp"

#include <sqlite3.h>

#include <mutex>
#include <string>

namespace cca::storage {

    enum class OpenMode {
        Create,        ///< Create the file and code_submissions when missing
        ExistingOnly,  ///< Fail unless the database file exists; write nothing
    };

    /**
     * SQLite implementation of IFindingStore.
     *
     * One connection per instance. In OpenMode::Create the database file is
     * created if it does not exist; its directory must exist. Thread safety is ensured through
     * internal mutex locking.
     */
    class SQLiteStore final : public IFindingStore {
    public:
        /**
         * @param db_path Filesystem path or ":memory:".
         * @param url URL reported by location(); defaults to db_path.
         */
        explicit SQLiteStore(std::string db_path, std::string url = "");

        /// Closes the connection.
        ~SQLiteStore() override;

        SQLiteStore(const SQLiteStore&) = delete;
        SQLiteStore& operator=(const SQLiteStore&) = delete;

        /**
         * Opens the connection. In Create mode it also enables WAL and
         * creates code_submissions.
         */
        Result<void> initialize(OpenMode mode = OpenMode::Create);

        Result<void> close();

        [[nodiscard]] bool is_open() const;

        [[nodiscard]] std::string location() const override;

        Result<void> ensure_schema(const TableSchema& schema) override;

        Result<std::size_t> insert(const std::string& table,
                                   const std::vector<FindingRow>& rows) override;

        Result<SubmissionId> new_submission_id(const std::string& filename,
                                               const std::string& content) override;

        Result<Submission> get_submission(SubmissionId id) override;

        Result<std::vector<Submission>> list_submissions(std::size_t limit) override;

        Result<std::vector<FindingRow>> query_findings(const std::string& table,
                                                       SubmissionId submission_id) override;

        Result<void> ping() override;

    private:
        // Callers hold mutex_.
        [[nodiscard]] Result<void> exec(const std::string& sql) const;
        [[nodiscard]] Result<void> require_open() const;
        [[nodiscard]] Result<bool> table_exists(const std::string& table) const;
        [[nodiscard]] Error last_error(const std::string& what) const;

        std::string db_path_;
        std::string url_;
        sqlite3* db_ = nullptr;
        mutable std::mutex mutex_;
    };

}  // namespace cca::storage

#endif //CCA_SQLITE_STORE_HPP

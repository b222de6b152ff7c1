//
// Created by gregorian-rayne on 2/10/26.
//

#ifndef CCA_FINDING_STORE_HPP
#define CCA_FINDING_STORE_HPP

#include "cca/types.hpp"
#include "cca/result.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cca::storage {

    /**
     * Column of a findings table. The type string may carry constraints.
     */
    struct ColumnDef {
        std::string name;           ///< Column name.
        std::string type;           ///< SQL type and constraints, e.g. "INTEGER".

        bool operator==(const ColumnDef&) const = default;
    };

    struct TableSchema {
        std::string name;           ///< Table name (plain identifier).
        std::vector<ColumnDef> columns;

        bool operator==(const TableSchema&) const = default;
    };

    /**
     * Schema shared by the four per-category tables.
     */
    [[nodiscard]] TableSchema findings_table_schema(const std::string& table_name);

    /**
     * Schema of "merged_findings": the per-category columns plus agent_type.
     */
    [[nodiscard]] TableSchema merged_findings_schema();

    inline constexpr auto MERGED_FINDINGS_TABLE = "merged_findings";
    inline constexpr auto SUBMISSIONS_TABLE = "code_submissions";

    /**
     * Table and column names are spliced into SQL, so only
     * [A-Za-z_][A-Za-z0-9_]* is accepted.
     */
    [[nodiscard]] bool is_valid_identifier(std::string_view name) noexcept;

    /**
     * One stored finding row.
     */
    struct FindingRow {
        SubmissionId submission_id = 0;          ///< Owning submission.
        std::string issue_type;                  ///< Finding::issue
        std::size_t line_number = 1;             ///< Finding::line
        std::string severity;                    ///< "LOW" .. "CRITICAL"
        std::string description;                 ///< Finding::snippet
        std::string suggested_fix;               ///< Finding::remediation
        std::optional<std::string> agent_type;   ///< Category tag, merged table only

        bool operator==(const FindingRow&) const = default;
    };

    [[nodiscard]] FindingRow to_row(const Finding& finding,
                                    SubmissionId submission_id,
                                    bool tag_with_category = false);

    /**
     * Rebuilds a Finding from a stored row. The category comes from the
     * agent_type tag when present, otherwise from fallback.
     */
    [[nodiscard]] Result<Finding> to_finding(const FindingRow& row,
                                             std::optional<Category> fallback = std::nullopt);

    /**
     * Durable, append-only store of submissions and findings.
     *
     * Implementations must be safe to share between threads; the SQLite store
     * serializes all calls on one connection behind a mutex.
     */
    class IFindingStore {
    public:
        virtual ~IFindingStore() = default;

        /// URL or path this store was opened from.
        [[nodiscard]] virtual std::string location() const = 0;

        /**
         * Creates the table if it does not exist. Idempotent.
         */
        virtual Result<void> ensure_schema(const TableSchema& schema) = 0;

        /**
         * Appends rows in one transaction: either all rows are written or
         * none are. Row ids are generated by the store; repeated inserts of
         * the same rows produce duplicates.
         *
         * @return Number of rows written.
         */
        virtual Result<std::size_t> insert(const std::string& table,
                                           const std::vector<FindingRow>& rows) = 0;

        /**
         * Registers a submission and returns its id. Ids are strictly
         * increasing for the lifetime of the store.
         */
        virtual Result<SubmissionId> new_submission_id(const std::string& filename,
                                                       const std::string& content) = 0;

        virtual Result<Submission> get_submission(SubmissionId id) = 0;

        /// Most recent submissions first.
        virtual Result<std::vector<Submission>> list_submissions(std::size_t limit) = 0;

        /**
         * Rows of one submission in insertion order. A table that does not
         * exist yet yields an empty list.
         */
        virtual Result<std::vector<FindingRow>> query_findings(const std::string& table,
                                                               SubmissionId submission_id) = 0;

        /// Cheap round trip used by health checks.
        virtual Result<void> ping() = 0;
    };

    using StorePtr = std::shared_ptr<IFindingStore>;

    /**
     * Opens a store from a URL. Replaceable in the coordinator so tests can
     * inject failing or in-memory stores.
     */
    using StoreOpener = std::function<Result<StorePtr>(const std::string& url)>;

    /**
     * Default opener: resolves the URL and opens a SQLite store.
     */
    [[nodiscard]] Result<StorePtr> open_store(const std::string& url);

    /**
     * Opens a store only if its database already exists, without creating
     * or altering anything. In-memory URLs open as usual.
     */
    [[nodiscard]] Result<StorePtr> open_existing_store(const std::string& url);

}  // namespace cca::storage

#endif //CCA_FINDING_STORE_HPP

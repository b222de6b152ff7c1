//
// Created by gregorian-rayne on 2/12/26.
//

#ifndef CCA_REPORT_HPP
#define CCA_REPORT_HPP

/**
 * @file report.hpp
 * @brief Rebuilding reports from storage and converting them to JSON.
 */

#include "cca/types.hpp"
#include "cca/result.hpp"
#include "cca/storage/finding_store.hpp"

#include <nlohmann/json.hpp>

namespace cca::report {

    /**
     * Recomputes a Report from the merged findings of a submission. The
     * execution mode is not stored, so the result reports Sequential.
     *
     * Fails with NotFound when the submission does not exist.
     */
    [[nodiscard]] Result<Report> load_report(storage::IFindingStore& store, SubmissionId id);

    [[nodiscard]] nlohmann::json finding_to_json(const Finding& finding);

    /**
     * Layout:
     * @code
     *     {
     *       "submission_id": 7,
     *       "filename": "app.py",
     *       "mode": "forked",
     *       "total_issues": 3,
     *       "categories": {"security": {"count": 1, "findings": [...]}, ...},
     *       "failures": [{"category": "performance", "error": "..."}]
     *     }
     * @endcode
     */
    [[nodiscard]] nlohmann::json report_to_json(const Report& report);

    [[nodiscard]] nlohmann::json submission_to_json(const Submission& submission, bool include_content = false);

    /**
     * Pretty-prints @p document with two-space indentation. Strings that are
     * not valid UTF-8 are written with U+FFFD in place of the bad bytes.
     */
    [[nodiscard]] std::string dump_json(const nlohmann::json& document);

}  // namespace cca::report

#endif //CCA_REPORT_HPP

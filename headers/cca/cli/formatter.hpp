//
// Created by gregorian-rayne on 2/12/26.
//

#ifndef CCA_FORMATTER_HPP
#define CCA_FORMATTER_HPP

/**
 * @file formatter.hpp
 * @brief Text rendering of reports, submission history and store status.
 */

#include "cca/types.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace cca::cli
{
    namespace colors {

        inline constexpr std::string_view RESET = "\033[0m";
        inline constexpr std::string_view BOLD = "\033[1m";
        inline constexpr std::string_view YELLOW = "\033[33m";

        /// True when colors are switched on and stdout is a terminal.
        bool enabled();
        void set_enabled(bool enable);

        /// Wraps @p text in @p code and RESET, or returns it unchanged when disabled.
        std::string paint(std::string_view text, std::string_view code);

    }  // namespace colors

    struct Column {
        std::string header;
        std::size_t width = 0;  ///< 0 sizes the column to its widest cell
        bool right_align = false;
    };

    using Row = std::vector<std::string>;

    /**
     * Column-aligned plain text table. Columns are joined by two spaces and
     * the last left-aligned column is not padded. Cells wider than a fixed
     * column width are cut with "...".
     */
    class Table {
    public:
        explicit Table(std::vector<Column> columns);

        /// Short rows are padded with empty cells.
        void add_row(Row row);

        /// Adds a dashed rule after the rows added so far.
        void add_separator();

        [[nodiscard]] std::string render() const;
        void render(std::ostream& out) const;

        [[nodiscard]] bool empty() const noexcept;

        void set_show_headers(const bool show) { show_headers_ = show; }

    private:
        [[nodiscard]] std::vector<std::size_t> column_widths() const;
        void write_row(std::ostream& out, const Row& row, const std::vector<std::size_t>& widths, bool header) const;
        void write_rule(std::ostream& out, const std::vector<std::size_t>& widths) const;

        std::vector<Column> columns_;
        std::vector<std::optional<Row>> lines_;  ///< nullopt marks a rule
        bool show_headers_ = true;
    };

    /// 1234567 -> "1,234,567"
    [[nodiscard]] std::string format_count(std::size_t count);

    /// Local time as "YYYY-MM-DD HH:MM:SS".
    [[nodiscard]] std::string format_timestamp(Timestamp ts);

    /// Cuts @p text to @p max_width, ending in "..." when there is room for it.
    [[nodiscard]] std::string truncate(std::string_view text, std::size_t max_width);

    class SummaryPrinter {
    public:
        explicit SummaryPrinter(std::ostream& out);

        /// Submission header plus one count per category; failed categories read "failed".
        void print_report_summary(const Report& report) const;

        /**
         * One table per category that has findings.
         *
         * @param limit Findings shown per category; 0 shows all.
         */
        void print_findings(const Report& report, std::size_t limit = 0) const;

        /// Categories a best-effort run could not complete, with their errors.
        void print_failures(const Report& report) const;

        void print_history(const std::vector<Submission>& submissions) const;

    private:
        void print_heading(std::string_view title, char rule) const;

        std::ostream& out_;
    };

}  // namespace cca::cli

#endif //CCA_FORMATTER_HPP

//
// Created by gregorian-rayne on 2/12/26.
//

#include "cca/cli/formatter.hpp"

#include <algorithm>
#include <atomic>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

#include <unistd.h>

namespace cca::cli
{
    namespace colors {

        namespace {
            std::atomic<bool> g_enabled{true};
        }

        bool enabled() {
            return g_enabled.load() && isatty(fileno(stdout)) != 0;
        }

        void set_enabled(const bool enable) {
            g_enabled.store(enable);
        }

        std::string paint(const std::string_view text, const std::string_view code) {
            if (!enabled()) {
                return std::string(text);
            }
            std::string painted;
            painted.reserve(code.size() + text.size() + RESET.size());
            painted.append(code).append(text).append(RESET);
            return painted;
        }

    }  // namespace colors

    namespace {
        constexpr std::string_view COLUMN_GAP = "  ";

        bool has_failed(const Report& report, const Category category) {
            return std::ranges::any_of(report.failures, [category](const AnalyzerFailure& failure) {
                return failure.category == category;
            });
        }
    }

    std::string format_count(const std::size_t count) {
        const std::string digits = std::to_string(count);
        std::string grouped;
        grouped.reserve(digits.size() + digits.size() / 3);
        for (std::size_t i = 0; i < digits.size(); ++i) {
            if (i != 0 && (digits.size() - i) % 3 == 0) {
                grouped += ',';
            }
            grouped += digits[i];
        }
        return grouped;
    }

    std::string format_timestamp(const Timestamp ts) {
        const std::time_t seconds = std::chrono::system_clock::to_time_t(ts);
        std::tm local{};
        localtime_r(&seconds, &local);

        std::ostringstream ss;
        ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
        return ss.str();
    }

    std::string truncate(const std::string_view text, const std::size_t max_width) {
        if (text.size() <= max_width) {
            return std::string(text);
        }
        if (max_width <= 3) {
            return std::string(text.substr(0, max_width));
        }
        return std::string(text.substr(0, max_width - 3)).append("...");
    }

    Table::Table(std::vector<Column> columns)
        : columns_(std::move(columns))
    {}

    void Table::add_row(Row row) {
        if (row.size() < columns_.size()) {
            row.resize(columns_.size());
        }
        lines_.emplace_back(std::move(row));
    }

    void Table::add_separator() {
        lines_.emplace_back(std::nullopt);
    }

    bool Table::empty() const noexcept {
        return std::ranges::none_of(lines_, [](const auto& line) { return line.has_value(); });
    }

    std::vector<std::size_t> Table::column_widths() const {
        std::vector<std::size_t> widths;
        widths.reserve(columns_.size());
        for (std::size_t col = 0; col < columns_.size(); ++col) {
            std::size_t width = columns_[col].width;
            if (width == 0) {
                width = columns_[col].header.size();
                for (const auto& line : lines_) {
                    if (line) {
                        width = std::max(width, (*line)[col].size());
                    }
                }
            }
            widths.push_back(width);
        }
        return widths;
    }

    void Table::write_row(std::ostream& out, const Row& row, const std::vector<std::size_t>& widths,
                          const bool header) const {
        for (std::size_t col = 0; col < columns_.size(); ++col) {
            const bool last = col + 1 == columns_.size();
            const auto width = static_cast<int>(widths[col]);
            const std::string cell = truncate(row[col], widths[col]);

            std::ostringstream padded;
            if (columns_[col].right_align) {
                padded << std::right << std::setw(width) << cell;
            } else if (!last) {
                padded << std::left << std::setw(width) << cell;
            } else {
                padded << cell;
            }

            out << (header ? colors::paint(padded.str(), colors::BOLD) : padded.str());
            if (!last) {
                out << COLUMN_GAP;
            }
        }
        out << "\n";
    }

    void Table::write_rule(std::ostream& out, const std::vector<std::size_t>& widths) const {
        std::size_t length = 0;
        for (const auto width : widths) {
            length += width;
        }
        if (!widths.empty()) {
            length += COLUMN_GAP.size() * (widths.size() - 1);
        }
        out << std::string(length, '-') << "\n";
    }

    std::string Table::render() const {
        std::ostringstream ss;
        render(ss);
        return ss.str();
    }

    void Table::render(std::ostream& out) const {
        const auto widths = column_widths();

        if (show_headers_) {
            Row header;
            for (const auto& column : columns_) {
                header.push_back(column.header);
            }
            write_row(out, header, widths, true);
            write_rule(out, widths);
        }

        for (const auto& line : lines_) {
            if (line) {
                write_row(out, *line, widths, false);
            } else {
                write_rule(out, widths);
            }
        }
    }

    SummaryPrinter::SummaryPrinter(std::ostream& out)
        : out_(out)
    {}

    void SummaryPrinter::print_heading(const std::string_view title, const char rule) const {
        out_ << colors::paint(title, colors::BOLD) << "\n" << std::string(60, rule) << "\n\n";
    }

    void SummaryPrinter::print_report_summary(const Report& report) const {
        out_ << "\n";
        print_heading("Analysis Summary", '=');

        const auto field = [this](const std::string_view label) -> std::ostream& {
            return out_ << std::left << std::setw(22) << label;
        };
        field("Submission:") << report.submission_id << "\n";
        field("File:") << report.filename << "\n";
        field("Execution Mode:") << to_string(report.mode) << "\n";
        field("Total Issues:") << format_count(report.total_issues()) << "\n\n";

        Table table({
            {"Category", 0, false},
            {"Issues", 0, true},
        });
        for (const auto category : ALL_CATEGORIES) {
            table.add_row({
                display_name(category),
                has_failed(report, category) ? "failed" : format_count(report.at(category).count)
            });
        }
        table.add_separator();
        table.add_row({"Total", format_count(report.total_issues())});
        table.render(out_);
        out_ << "\n";
    }

    void SummaryPrinter::print_findings(const Report& report, const std::size_t limit) const {
        for (const auto category : ALL_CATEGORIES) {
            const auto& findings = report.at(category).findings;
            if (findings.empty()) {
                continue;
            }

            print_heading(std::string(display_name(category)) + " (" +
                          format_count(report.at(category).count) + ")", '-');

            Table table({
                {"Line", 0, true},
                {"Severity", 8, false},
                {"Issue", 0, false},
                {"Snippet", 60, false},
            });
            const std::size_t shown = limit == 0 ? findings.size() : std::min(limit, findings.size());
            for (auto it = findings.begin(); it != findings.begin() + static_cast<std::ptrdiff_t>(shown); ++it) {
                table.add_row({std::to_string(it->line), to_string(it->severity), it->issue, it->snippet});
            }
            table.render(out_);

            if (shown < findings.size()) {
                out_ << "  ... and " << findings.size() - shown << " more\n";
            }
            out_ << "\n";
        }
    }

    void SummaryPrinter::print_failures(const Report& report) const {
        if (report.failures.empty()) {
            return;
        }

        out_ << colors::paint("Warning: ", colors::YELLOW) << report.failures.size()
             << " analyzer(s) failed; their categories are incomplete\n";
        for (const auto& [category, error] : report.failures) {
            out_ << "  " << display_name(category) << ": " << error << "\n";
        }
        out_ << "\n";
    }

    void SummaryPrinter::print_history(const std::vector<Submission>& submissions) const {
        if (submissions.empty()) {
            out_ << "No submissions recorded.\n";
            return;
        }

        print_heading("Recent Submissions", '-');

        Table table({
            {"ID", 0, true},
            {"Uploaded", 0, false},
            {"Size", 0, true},
            {"File", 50, false},
        });
        for (const auto& submission : submissions) {
            table.add_row({
                std::to_string(submission.id),
                format_timestamp(submission.created_at),
                format_count(submission.content.size()) + " B",
                submission.filename
            });
        }
        table.render(out_);
    }

}  // namespace cca::cli

#include "stratify/report/console_reporter.hpp"

#include <ftxui/dom/elements.hpp>
#include <ftxui/dom/table.hpp>
#include <ftxui/screen/screen.hpp>

#include <ostream>

namespace stratify {

auto display_path(const std::filesystem::path& path, const std::filesystem::path& project_root)
    -> std::string {
    auto relative = path.lexically_normal().lexically_relative(project_root.lexically_normal());
    if (relative.empty() || *relative.begin() == "..") {
        return path.generic_string();
    }
    return relative.generic_string();
}

auto violation_rows(const std::vector<StructureViolation>& violations,
                    const std::filesystem::path& project_root) -> TableRows {
    TableRows rows{{"Rule", "Severity", "Location", "Message"}};
    for (const auto& violation : violations) {
        rows.push_back({violation.rule_id, severity_name(violation.severity),
                        display_path(violation.location, project_root), violation.message});
    }
    return rows;
}

auto result_rows(const std::vector<FixResult>& results, const std::filesystem::path& project_root)
    -> TableRows {
    TableRows rows{{"Rule", "Status", "Location", "Description"}};
    for (const auto& result : results) {
        rows.push_back({result.violation.rule_id, status_name(result.status),
                        display_path(result.violation.location, project_root), result.description});
    }
    return rows;
}

auto summary_line(const FixSummary& summary, bool dry_run) -> std::string {
    auto line = std::to_string(summary.total()) + " violation(s): ";
    if (dry_run) {
        line += std::to_string(summary.dry_run) + " would be fixed, ";
    } else {
        line += std::to_string(summary.fixed) + " fixed, ";
    }
    line += std::to_string(summary.skipped) + " skipped, " + std::to_string(summary.failed) + " failed";
    return line;
}

ConsoleReporter::ConsoleReporter(std::ostream& out, std::filesystem::path project_root)
    : out_(out), project_root_(std::move(project_root)) {}

auto ConsoleReporter::report_violations(const std::vector<StructureViolation>& violations) -> void {
    if (violations.empty()) {
        out_ << "No violations found\n";
        return;
    }
    out_ << violations.size() << " violation(s) found\n";
    render_table(violation_rows(violations, project_root_));
}

auto ConsoleReporter::report_results(const std::vector<FixResult>& results, bool dry_run) -> void {
    if (results.empty()) {
        return;
    }
    render_table(result_rows(results, project_root_));

    for (const auto& result : results) {
        auto lines = render_diff(result.diffs);
        if (lines.empty()) {
            continue;
        }
        out_ << "\n" << result.violation.rule_id << " " << display_path(result.violation.location, project_root_)
             << "\n";
        for (const auto& line : lines) {
            out_ << "  " << line << "\n";
        }
    }

    out_ << "\n" << summary_line(summarize(results), dry_run) << "\n";
}

auto ConsoleReporter::render_table(const TableRows& rows) -> void {
    auto table = ftxui::Table(rows);
    table.SelectAll().Border(ftxui::LIGHT);
    table.SelectAll().SeparatorVertical(ftxui::LIGHT);
    table.SelectRow(0).Decorate(ftxui::bold);
    table.SelectRow(0).BorderBottom(ftxui::LIGHT);

    auto element = table.Render();
    auto screen = ftxui::Screen::Create(ftxui::Dimension::Fit(element));
    ftxui::Render(screen, element);
    out_ << screen.ToString() << "\n";
}

} // namespace stratify

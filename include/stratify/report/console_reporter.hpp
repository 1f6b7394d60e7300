#pragma once

#include "stratify/core/fix_result.hpp"
#include "stratify/core/violation.hpp"
#include "stratify/remediation/orchestrator.hpp"
#include <filesystem>
#include <iosfwd>
#include <string>
#include <vector>

namespace stratify {

using TableRows = std::vector<std::vector<std::string>>;

// Table models (pure)
auto violation_rows(const std::vector<StructureViolation>& violations,
                    const std::filesystem::path& project_root) -> TableRows;
auto result_rows(const std::vector<FixResult>& results, const std::filesystem::path& project_root)
    -> TableRows;
auto summary_line(const FixSummary& summary, bool dry_run) -> std::string;

// Path shown relative to the project root when it lies beneath it
auto display_path(const std::filesystem::path& path, const std::filesystem::path& project_root)
    -> std::string;

// Renders reports as FTXUI tables into a stream
class ConsoleReporter {
public:
    ConsoleReporter(std::ostream& out, std::filesystem::path project_root);

    auto report_violations(const std::vector<StructureViolation>& violations) -> void;
    auto report_results(const std::vector<FixResult>& results, bool dry_run) -> void;

private:
    auto render_table(const TableRows& rows) -> void;

    std::ostream& out_;
    std::filesystem::path project_root_;
};

} // namespace stratify

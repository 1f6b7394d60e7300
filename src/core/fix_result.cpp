#include "stratify/core/fix_result.hpp"

namespace stratify {

auto status_name(FixStatus status) -> std::string {
    switch (status) {
    case FixStatus::FIXED:
        return "FIXED";
    case FixStatus::SKIPPED:
        return "SKIPPED";
    case FixStatus::FAILED:
        return "FAILED";
    case FixStatus::DRY_RUN:
        return "DRY_RUN";
    }
    return "SKIPPED";
}

auto fix_skipped(const StructureViolation& violation, std::string reason) -> FixResult {
    return FixResult{
        .violation = violation,
        .status = FixStatus::SKIPPED,
        .description = std::move(reason),
    };
}

auto fix_failed(const StructureViolation& violation, std::string error) -> FixResult {
    return FixResult{
        .violation = violation,
        .status = FixStatus::FAILED,
        .description = "Fix failed: " + error,
        .error_message = std::move(error),
    };
}

auto fix_applied(const StructureViolation& violation,
                 bool dry_run,
                 std::string description,
                 std::vector<std::filesystem::path> files,
                 std::vector<DiffPair> diffs) -> FixResult {
    FixResult result{
        .violation = violation,
        .status = dry_run ? FixStatus::DRY_RUN : FixStatus::FIXED,
        .description = std::move(description),
        .planned_files = files,
        .diffs = std::move(diffs),
    };
    if (!dry_run) {
        result.modified_files = std::move(files);
    }
    return result;
}

auto render_diff(const std::vector<DiffPair>& diffs) -> std::vector<std::string> {
    std::vector<std::string> lines;
    for (const auto& diff : diffs) {
        if (!diff.removed.empty()) {
            lines.push_back("- " + diff.removed);
        }
        if (!diff.added.empty()) {
            lines.push_back("+ " + diff.added);
        }
    }
    return lines;
}

} // namespace stratify

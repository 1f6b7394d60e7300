#pragma once

#include "stratify/core/violation.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace stratify {

enum class FixStatus {
    FIXED,
    SKIPPED,
    FAILED,
    DRY_RUN
};

// One before/after pair of a diff. An empty side means "nothing" (pure addition or removal).
struct DiffPair {
    std::string removed;
    std::string added;

    auto operator==(const DiffPair& other) const -> bool = default;
};

struct FixResult {
    StructureViolation violation;
    FixStatus status = FixStatus::SKIPPED;
    std::string description;
    std::vector<std::filesystem::path> modified_files;  // Only files whose bytes changed
    std::vector<std::filesystem::path> planned_files;   // Same in dry-run and full mode
    std::vector<DiffPair> diffs;
    std::string error_message;

    auto is_success() const -> bool {
        return status == FixStatus::FIXED || status == FixStatus::DRY_RUN;
    }
};

auto status_name(FixStatus status) -> std::string;

auto fix_skipped(const StructureViolation& violation, std::string reason) -> FixResult;
auto fix_failed(const StructureViolation& violation, std::string error) -> FixResult;

// FIXED in full mode, DRY_RUN otherwise. modified_files stays empty for a dry run.
auto fix_applied(const StructureViolation& violation,
                 bool dry_run,
                 std::string description,
                 std::vector<std::filesystem::path> files,
                 std::vector<DiffPair> diffs) -> FixResult;

// "- old" / "+ new" lines for display
auto render_diff(const std::vector<DiffPair>& diffs) -> std::vector<std::string>;

} // namespace stratify

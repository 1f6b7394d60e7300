#include "stratify/backup/backup_strategy.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>

namespace stratify {

auto next_transaction_id() -> std::string {
    static std::atomic<unsigned long> counter{0};
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                      std::chrono::system_clock::now().time_since_epoch())
                      .count();
    return std::to_string(millis) + "-" + std::to_string(++counter);
}

auto normalize_targets(const std::vector<std::filesystem::path>& files,
                       const std::filesystem::path& project_root) -> std::vector<std::filesystem::path> {
    std::vector<std::filesystem::path> targets;
    for (const auto& file : files) {
        auto absolute = file.is_absolute() ? file : project_root / file;
        absolute = absolute.lexically_normal();
        if (std::find(targets.begin(), targets.end(), absolute) == targets.end()) {
            targets.push_back(std::move(absolute));
        }
    }
    return targets;
}

auto first_missing_ancestor(const std::filesystem::path& file, const std::filesystem::path& project_root)
    -> std::filesystem::path {
    std::filesystem::path missing;
    auto root = project_root.lexically_normal();
    std::error_code ec;
    for (auto dir = file.parent_path(); !dir.empty() && dir != root && dir != dir.root_path();
         dir = dir.parent_path()) {
        if (std::filesystem::exists(dir, ec)) {
            break;
        }
        missing = dir;
    }
    return missing;
}

auto remove_created(const BackupEntry& entry) -> RestoreResult {
    RestoreResult result{.target_path = entry.target, .backup_path = entry.backup_path};

    std::error_code ec;
    std::filesystem::remove(entry.target, ec);
    if (ec) {
        result.message = "Cannot remove created file: " + ec.message();
        return result;
    }

    // Prune directories created for the file, innermost first, stopping at the first non-empty one
    if (!entry.created_root.empty()) {
        for (auto dir = entry.target.parent_path(); !dir.empty(); dir = dir.parent_path()) {
            if (!std::filesystem::is_directory(dir, ec) || !std::filesystem::is_empty(dir, ec)) {
                break;
            }
            std::filesystem::remove(dir, ec);
            if (dir == entry.created_root) {
                break;
            }
        }
    }

    result.success = true;
    result.message = "Removed file that did not exist before the fix";
    return result;
}

} // namespace stratify

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace stratify {

struct BackupEntry {
    std::filesystem::path target;
    std::filesystem::path backup_path;   // Empty for absent targets and in-memory snapshots
    bool absent = false;                 // Target did not exist when the backup was taken
    std::filesystem::path created_root;  // Outermost missing ancestor directory of an absent target
};

// Everything needed to restore one transaction's files
struct BackupHandle {
    std::string strategy;
    std::string id;
    std::filesystem::path project_root;
    std::vector<BackupEntry> entries;
};

struct RestoreResult {
    std::filesystem::path target_path;
    std::filesystem::path backup_path;
    bool success = false;
    std::optional<std::string> message;
};

// Snapshots files before a fix and restores them if the fix does not complete.
// rollback() restores in reverse backup order and reports per-file outcomes
// instead of throwing. It never discards the snapshot; only cleanup() does, so a
// failed restore can be retried.
class IBackupStrategy {
public:
    virtual ~IBackupStrategy() = default;
    virtual auto name() const -> std::string = 0;
    virtual auto backup(const std::vector<std::filesystem::path>& files,
                        const std::filesystem::path& project_root) -> BackupHandle = 0;
    virtual auto rollback(const BackupHandle& handle) -> std::vector<RestoreResult> = 0;
    virtual auto cleanup(const BackupHandle& handle) -> void = 0;
};

// Unique within the process
auto next_transaction_id() -> std::string;

// Absolute, normalized, deduplicated, original order kept
auto normalize_targets(const std::vector<std::filesystem::path>& files,
                       const std::filesystem::path& project_root) -> std::vector<std::filesystem::path>;

// Outermost ancestor of file (below project_root) that does not exist yet; empty if all exist
auto first_missing_ancestor(const std::filesystem::path& file, const std::filesystem::path& project_root)
    -> std::filesystem::path;

// Restores the "did not exist" state: deletes the file and any directories created for it
auto remove_created(const BackupEntry& entry) -> RestoreResult;

} // namespace stratify

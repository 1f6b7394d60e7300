#pragma once

#include "stratify/backup/backup_strategy.hpp"
#include <filesystem>
#include <vector>

namespace stratify {

// RAII guard around one fix: backs up on construction, restores on destruction
// unless commit() or rollback() ran first
class BackupTransaction {
    IBackupStrategy* strategy_;
    BackupHandle handle_;
    bool finished_ = false;

public:
    BackupTransaction(IBackupStrategy& strategy, const std::vector<std::filesystem::path>& files,
                      const std::filesystem::path& project_root);

    ~BackupTransaction();

    // Keeps the changes and discards the backups
    auto commit() -> void;

    // Restores every file; the backups are discarded only if all of them came back
    auto rollback() -> std::vector<RestoreResult>;

    auto handle() const -> const BackupHandle& { return handle_; }

    // Delete copy operations
    BackupTransaction(const BackupTransaction&) = delete;
    auto operator=(const BackupTransaction&) -> BackupTransaction& = delete;

    // Move operations
    BackupTransaction(BackupTransaction&& other) noexcept;
};

} // namespace stratify

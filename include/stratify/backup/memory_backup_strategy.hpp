#pragma once

#include "stratify/backup/backup_strategy.hpp"
#include <map>
#include <mutex>
#include <string>

namespace stratify {

// Keeps file contents in memory for the lifetime of the transaction
class MemoryBackupStrategy : public IBackupStrategy {
public:
    auto name() const -> std::string override;
    auto backup(const std::vector<std::filesystem::path>& files,
                const std::filesystem::path& project_root) -> BackupHandle override;
    auto rollback(const BackupHandle& handle) -> std::vector<RestoreResult> override;
    auto cleanup(const BackupHandle& handle) -> void override;

    auto pending_transactions() const -> size_t;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::map<std::filesystem::path, std::string>> snapshots_;
};

} // namespace stratify

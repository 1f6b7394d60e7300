#pragma once

#include "stratify/backup/backup_strategy.hpp"
#include <string_view>

namespace stratify {

inline constexpr std::string_view STAGING_DIRECTORY = ".remediation/staging";
inline constexpr std::string_view BACKUP_EXTENSION = ".bak";

// Copies each file to <root>/.remediation/staging/<transaction>/<relative path>.bak
class StagingBackupStrategy : public IBackupStrategy {
public:
    auto name() const -> std::string override;
    auto backup(const std::vector<std::filesystem::path>& files,
                const std::filesystem::path& project_root) -> BackupHandle override;
    auto rollback(const BackupHandle& handle) -> std::vector<RestoreResult> override;
    auto cleanup(const BackupHandle& handle) -> void override;

    static auto transaction_directory(const BackupHandle& handle) -> std::filesystem::path;
};

} // namespace stratify

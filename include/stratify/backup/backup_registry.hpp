#pragma once

#include "stratify/backup/backup_strategy.hpp"
#include "stratify/interfaces.hpp"
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace stratify {

inline constexpr std::string_view DEFAULT_BACKUP_STRATEGY = "staging";

// Named backup strategies; "staging" and "memory" are built in
class BackupStrategyRegistry {
public:
    BackupStrategyRegistry();

    auto register_strategy(std::unique_ptr<IBackupStrategy> strategy) -> void;
    auto find(std::string_view name) const -> IBackupStrategy*;
    auto names() const -> std::vector<std::string>;
    auto default_strategy() const -> IBackupStrategy&;

    // Unknown names fall back to the default strategy with a warning
    auto select(std::string_view name, ILogSink& log) const -> IBackupStrategy&;

private:
    std::vector<std::unique_ptr<IBackupStrategy>> strategies_;
};

} // namespace stratify

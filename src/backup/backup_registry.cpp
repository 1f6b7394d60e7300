#include "stratify/backup/backup_registry.hpp"
#include "stratify/backup/memory_backup_strategy.hpp"
#include "stratify/backup/staging_backup_strategy.hpp"

namespace stratify {

BackupStrategyRegistry::BackupStrategyRegistry() {
    register_strategy(std::make_unique<StagingBackupStrategy>());
    register_strategy(std::make_unique<MemoryBackupStrategy>());
}

auto BackupStrategyRegistry::register_strategy(std::unique_ptr<IBackupStrategy> strategy) -> void {
    auto name = strategy->name();
    for (auto& existing : strategies_) {
        if (existing->name() == name) {
            existing = std::move(strategy);
            return;
        }
    }
    strategies_.push_back(std::move(strategy));
}

auto BackupStrategyRegistry::find(std::string_view name) const -> IBackupStrategy* {
    for (const auto& strategy : strategies_) {
        if (strategy->name() == name) {
            return strategy.get();
        }
    }
    return nullptr;
}

auto BackupStrategyRegistry::names() const -> std::vector<std::string> {
    std::vector<std::string> result;
    for (const auto& strategy : strategies_) {
        result.push_back(strategy->name());
    }
    return result;
}

auto BackupStrategyRegistry::default_strategy() const -> IBackupStrategy& {
    return *find(DEFAULT_BACKUP_STRATEGY);
}

auto BackupStrategyRegistry::select(std::string_view name, ILogSink& log) const -> IBackupStrategy& {
    if (auto* strategy = find(name)) {
        return *strategy;
    }
    log.warn("Unknown backup strategy '" + std::string(name) + "', using "
             + std::string(DEFAULT_BACKUP_STRATEGY));
    return default_strategy();
}

} // namespace stratify

#include "stratify/backup/backup_transaction.hpp"
#include <algorithm>

namespace stratify {

namespace {

auto all_restored(const std::vector<RestoreResult>& results) -> bool {
    return std::all_of(results.begin(), results.end(), [](const RestoreResult& r) { return r.success; });
}

} // namespace

BackupTransaction::BackupTransaction(IBackupStrategy& strategy,
                                     const std::vector<std::filesystem::path>& files,
                                     const std::filesystem::path& project_root)
    : strategy_(&strategy), handle_(strategy.backup(files, project_root)) {}

BackupTransaction::~BackupTransaction() {
    if (!finished_) {
        rollback();
    }
}

auto BackupTransaction::commit() -> void {
    if (finished_) {
        return;
    }
    finished_ = true;
    strategy_->cleanup(handle_);
}

auto BackupTransaction::rollback() -> std::vector<RestoreResult> {
    if (finished_) {
        return {};
    }
    finished_ = true;
    auto results = strategy_->rollback(handle_);
    // Snapshots stay in place while any file could not be restored
    if (all_restored(results)) {
        strategy_->cleanup(handle_);
    }
    return results;
}

BackupTransaction::BackupTransaction(BackupTransaction&& other) noexcept
    : strategy_(other.strategy_), handle_(std::move(other.handle_)), finished_(other.finished_) {
    other.finished_ = true; // Prevent rollback in moved-from object
}

} // namespace stratify

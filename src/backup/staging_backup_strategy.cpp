#include "stratify/backup/staging_backup_strategy.hpp"
#include "stratify/errors.hpp"

namespace stratify {

namespace {

auto staging_relative(const std::filesystem::path& target, const std::filesystem::path& project_root)
    -> std::filesystem::path {
    auto relative = target.lexically_relative(project_root.lexically_normal());
    if (relative.empty() || *relative.begin() == "..") {
        return target.relative_path();
    }
    return relative;
}

} // namespace

auto StagingBackupStrategy::name() const -> std::string {
    return "staging";
}

auto StagingBackupStrategy::transaction_directory(const BackupHandle& handle) -> std::filesystem::path {
    return handle.project_root / STAGING_DIRECTORY / handle.id;
}

auto StagingBackupStrategy::backup(const std::vector<std::filesystem::path>& files,
                                   const std::filesystem::path& project_root) -> BackupHandle {
    BackupHandle handle{
        .strategy = name(),
        .id = next_transaction_id(),
        .project_root = project_root.lexically_normal(),
    };
    auto staging = transaction_directory(handle);

    for (const auto& target : normalize_targets(files, project_root)) {
        std::error_code ec;
        if (!std::filesystem::exists(target, ec)) {
            handle.entries.push_back({
                .target = target,
                .absent = true,
                .created_root = first_missing_ancestor(target, project_root),
            });
            continue;
        }

        auto backup_path = staging / staging_relative(target, project_root);
        backup_path += BACKUP_EXTENSION;

        std::filesystem::create_directories(backup_path.parent_path(), ec);
        if (!ec) {
            std::filesystem::copy_file(target, backup_path,
                                       std::filesystem::copy_options::overwrite_existing, ec);
        }
        if (ec) {
            cleanup(handle);
            throw IoError("Cannot back up " + target.string() + ": " + ec.message());
        }
        handle.entries.push_back({.target = target, .backup_path = backup_path});
    }
    return handle;
}

auto StagingBackupStrategy::rollback(const BackupHandle& handle) -> std::vector<RestoreResult> {
    std::vector<RestoreResult> results;

    for (auto it = handle.entries.rbegin(); it != handle.entries.rend(); ++it) {
        const auto& entry = *it;
        if (entry.absent) {
            results.push_back(remove_created(entry));
            continue;
        }

        RestoreResult result{.target_path = entry.target, .backup_path = entry.backup_path};
        std::error_code ec;
        std::filesystem::create_directories(entry.target.parent_path(), ec);
        std::filesystem::copy_file(entry.backup_path, entry.target,
                                   std::filesystem::copy_options::overwrite_existing, ec);
        if (ec) {
            result.message = "Restore failed: " + ec.message();
        } else {
            result.success = true;
        }
        results.push_back(std::move(result));
    }
    return results;
}

auto StagingBackupStrategy::cleanup(const BackupHandle& handle) -> void {
    std::error_code ec;
    std::filesystem::remove_all(transaction_directory(handle), ec);

    // Drop the staging tree once no other transaction uses it
    auto staging_root = handle.project_root / STAGING_DIRECTORY;
    for (auto dir = staging_root; dir != handle.project_root && !dir.empty(); dir = dir.parent_path()) {
        if (!std::filesystem::is_directory(dir, ec) || !std::filesystem::is_empty(dir, ec)) {
            break;
        }
        std::filesystem::remove(dir, ec);
    }
}

} // namespace stratify

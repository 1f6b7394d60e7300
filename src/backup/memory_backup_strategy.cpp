#include "stratify/backup/memory_backup_strategy.hpp"
#include "stratify/errors.hpp"
#include <fstream>
#include <sstream>

namespace stratify {

namespace {

auto read_bytes(const std::filesystem::path& path) -> std::string {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw IoError("Cannot back up " + path.string() + ": file not readable");
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

auto write_bytes(const std::filesystem::path& path, const std::string& content) -> bool {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        return false;
    }
    file << content;
    file.flush();
    return !file.fail();
}

} // namespace

auto MemoryBackupStrategy::name() const -> std::string {
    return "memory";
}

auto MemoryBackupStrategy::backup(const std::vector<std::filesystem::path>& files,
                                  const std::filesystem::path& project_root) -> BackupHandle {
    BackupHandle handle{
        .strategy = name(),
        .id = next_transaction_id(),
        .project_root = project_root.lexically_normal(),
    };

    std::map<std::filesystem::path, std::string> contents;
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
        contents.emplace(target, read_bytes(target));
        handle.entries.push_back({.target = target});
    }

    std::lock_guard lock(mutex_);
    snapshots_.emplace(handle.id, std::move(contents));
    return handle;
}

auto MemoryBackupStrategy::rollback(const BackupHandle& handle) -> std::vector<RestoreResult> {
    std::map<std::filesystem::path, std::string> contents;
    {
        std::lock_guard lock(mutex_);
        if (auto it = snapshots_.find(handle.id); it != snapshots_.end()) {
            contents = it->second;
        }
    }

    std::vector<RestoreResult> results;
    for (auto it = handle.entries.rbegin(); it != handle.entries.rend(); ++it) {
        const auto& entry = *it;
        if (entry.absent) {
            results.push_back(remove_created(entry));
            continue;
        }

        RestoreResult result{.target_path = entry.target};
        auto snapshot = contents.find(entry.target);
        if (snapshot == contents.end()) {
            result.message = "No snapshot held for this file";
        } else if (!write_bytes(entry.target, snapshot->second)) {
            result.message = "Restore failed: cannot write file";
        } else {
            result.success = true;
        }
        results.push_back(std::move(result));
    }
    return results;
}

auto MemoryBackupStrategy::cleanup(const BackupHandle& handle) -> void {
    std::lock_guard lock(mutex_);
    snapshots_.erase(handle.id);
}

auto MemoryBackupStrategy::pending_transactions() const -> size_t {
    std::lock_guard lock(mutex_);
    return snapshots_.size();
}

} // namespace stratify

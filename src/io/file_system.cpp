#include "stratify/io/file_system.hpp"
#include "stratify/errors.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>

namespace stratify {

auto FileSystem::read_file(const std::filesystem::path& path) -> std::string {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw IoError("Cannot open file for reading: " + path.string());
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw IoError("Failed reading file: " + path.string());
    }
    return buffer.str();
}

auto FileSystem::write_file(const std::filesystem::path& path, const std::string& content) -> void {
    if (path.has_parent_path() && !is_directory(path.parent_path())) {
        create_directories(path.parent_path());
    }
    write_atomic(path, content);
}

auto FileSystem::exists(const std::filesystem::path& path) -> bool {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

auto FileSystem::is_directory(const std::filesystem::path& path) -> bool {
    std::error_code ec;
    return std::filesystem::is_directory(path, ec);
}

auto FileSystem::is_regular_file(const std::filesystem::path& path) -> bool {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

auto FileSystem::create_directories(const std::filesystem::path& path) -> void {
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    if (ec) {
        throw IoError("Cannot create directory " + path.string() + ": " + ec.message());
    }
}

auto FileSystem::list_files(const std::filesystem::path& root) -> std::vector<std::filesystem::path> {
    std::vector<std::filesystem::path> files;
    if (!is_directory(root)) {
        return files;
    }

    std::error_code ec;
    auto options = std::filesystem::directory_options::skip_permission_denied;
    for (auto it = std::filesystem::recursive_directory_iterator(root, options, ec);
         !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        std::error_code type_ec;
        if (it->is_regular_file(type_ec)) {
            files.push_back(it->path());
        }
    }
    if (ec) {
        throw IoError("Cannot list directory " + root.string() + ": " + ec.message());
    }

    std::sort(files.begin(), files.end());
    return files;
}

auto FileSystem::list_directories(const std::filesystem::path& root)
    -> std::vector<std::filesystem::path> {
    std::vector<std::filesystem::path> directories;
    if (!is_directory(root)) {
        return directories;
    }

    std::error_code ec;
    for (auto it = std::filesystem::directory_iterator(root, ec);
         !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
        std::error_code type_ec;
        if (it->is_directory(type_ec)) {
            directories.push_back(it->path());
        }
    }
    if (ec) {
        throw IoError("Cannot list directory " + root.string() + ": " + ec.message());
    }

    std::sort(directories.begin(), directories.end());
    return directories;
}

auto FileSystem::set_executable(const std::filesystem::path& path) -> bool {
    std::error_code ec;
    std::filesystem::permissions(path,
                                 std::filesystem::perms::owner_exec | std::filesystem::perms::group_exec
                                     | std::filesystem::perms::others_exec,
                                 std::filesystem::perm_options::add, ec);
    return !ec;
}

auto FileSystem::write_atomic(const std::filesystem::path& path, const std::string& content) -> void {
    // Write to temporary file first for atomic operation
    auto temp_path = path;
    temp_path += ".tmp";

    {
        std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            throw IoError("Cannot open file for writing: " + temp_path.string());
        }
        file << content;
        file.flush();
        if (file.fail()) {
            file.close();
            std::error_code ignored;
            std::filesystem::remove(temp_path, ignored);
            throw IoError("Failed writing file: " + path.string());
        }
    } // File automatically closed here

    // Keep the permission bits of the file being replaced
    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        auto status = std::filesystem::status(path, ec);
        if (!ec) {
            std::filesystem::permissions(temp_path, status.permissions(),
                                         std::filesystem::perm_options::replace, ec);
        }
    }

    // Atomically replace original file
    std::filesystem::rename(temp_path, path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temp_path, ignored);
        throw IoError("Cannot replace " + path.string() + ": " + ec.message());
    }
}

} // namespace stratify

#pragma once

#include "stratify/interfaces.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace stratify {

// Local disk implementation. Failures surface as IoError.
class FileSystem : public IFileSystem {
public:
    auto read_file(const std::filesystem::path& path) -> std::string override;
    auto write_file(const std::filesystem::path& path, const std::string& content) -> void override;
    auto exists(const std::filesystem::path& path) -> bool override;
    auto is_directory(const std::filesystem::path& path) -> bool override;
    auto is_regular_file(const std::filesystem::path& path) -> bool override;
    auto create_directories(const std::filesystem::path& path) -> void override;
    auto list_files(const std::filesystem::path& root) -> std::vector<std::filesystem::path> override;
    auto list_directories(const std::filesystem::path& root)
        -> std::vector<std::filesystem::path> override;
    auto set_executable(const std::filesystem::path& path) -> bool override;

private:
    auto write_atomic(const std::filesystem::path& path, const std::string& content) -> void;
};

} // namespace stratify

#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace stratify {

// Abstract interfaces for dependency injection
class IFileSystem {
public:
    virtual ~IFileSystem() = default;
    virtual auto read_file(const std::filesystem::path& path) -> std::string = 0;
    virtual auto write_file(const std::filesystem::path& path, const std::string& content) -> void = 0;
    virtual auto exists(const std::filesystem::path& path) -> bool = 0;
    virtual auto is_directory(const std::filesystem::path& path) -> bool = 0;
    virtual auto is_regular_file(const std::filesystem::path& path) -> bool = 0;
    virtual auto create_directories(const std::filesystem::path& path) -> void = 0;
    virtual auto list_files(const std::filesystem::path& root) -> std::vector<std::filesystem::path> = 0;
    virtual auto list_directories(const std::filesystem::path& root) -> std::vector<std::filesystem::path> = 0;
    virtual auto set_executable(const std::filesystem::path& path) -> bool = 0;
};

class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual auto info(std::string_view message) -> void = 0;
    virtual auto warn(std::string_view message) -> void = 0;
    virtual auto error(std::string_view message) -> void = 0;
};

} // namespace stratify

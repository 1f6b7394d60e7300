#pragma once

#include "stratify/core/module_info.hpp"
#include "stratify/interfaces.hpp"
#include <filesystem>
#include <string_view>
#include <vector>

namespace stratify {

inline constexpr std::string_view SOURCE_DIRECTORY = "src/main/java";
inline constexpr std::string_view SOURCE_EXTENSION = ".java";
inline constexpr std::string_view PACKAGE_MARKER = "package-info.java";

auto is_source_file(const std::filesystem::path& path) -> bool;

// Locates source roots of a module and the source files beneath them
class ModuleSourceIndex {
public:
    explicit ModuleSourceIndex(IFileSystem& filesystem);

    // The module's own source root plus one per present layer submodule, existing roots only
    auto source_roots(const ModuleInfo& module) -> std::vector<std::filesystem::path>;

    // Source root of one layer submodule ("api", "core", "spi", "facade")
    auto layer_source_root(const ModuleInfo& module, std::string_view role) -> std::filesystem::path;

    // Source files under root, sorted, package markers excluded
    auto source_files(const std::filesystem::path& root) -> std::vector<std::filesystem::path>;

private:
    IFileSystem& filesystem_;
};

} // namespace stratify

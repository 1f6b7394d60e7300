#pragma once

#include "stratify/core/module_info.hpp"
#include "stratify/interfaces.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace stratify {

inline constexpr std::string_view BUILD_DESCRIPTOR = "pom.xml";
inline constexpr std::string_view AGGREGATOR_PACKAGING = "pom";

// Inspects the directory for "<base>-<role>" submodules
auto scan_module(IFileSystem& filesystem, const std::filesystem::path& module_path) -> ModuleInfo;

// Every directory under the root (root included) holding a build descriptor.
// Hidden directories, build output and source trees are not descended into.
auto discover_modules(IFileSystem& filesystem, const std::filesystem::path& project_root)
    -> std::vector<ModuleInfo>;

// Packaging declared by the module's build descriptor ("jar" when unspecified),
// nullopt when the module has no descriptor
auto read_packaging(IFileSystem& filesystem, const std::filesystem::path& module_path)
    -> std::optional<std::string>;

auto is_aggregator(IFileSystem& filesystem, const std::filesystem::path& module_path) -> bool;

// Aggregator whose only job is grouping other modules (no layer submodules of its own)
auto is_pure_aggregator(IFileSystem& filesystem, const ModuleInfo& module) -> bool;

} // namespace stratify

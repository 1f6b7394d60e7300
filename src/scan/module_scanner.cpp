#include "stratify/scan/module_scanner.hpp"
#include "stratify/core/functional_core.hpp"
#include <algorithm>
#include <array>

namespace stratify {

namespace {

constexpr std::array SKIPPED_DIRECTORIES = {
    std::string_view{"target"},
    std::string_view{"src"},
    std::string_view{"node_modules"},
    std::string_view{"build"},
};

auto should_descend(const std::filesystem::path& directory) -> bool {
    auto name = directory.filename().string();
    if (name.empty() || name.starts_with('.')) {
        return false;
    }
    return std::find(SKIPPED_DIRECTORIES.begin(), SKIPPED_DIRECTORIES.end(), name)
           == SKIPPED_DIRECTORIES.end();
}

auto collect_modules(IFileSystem& filesystem, const std::filesystem::path& directory,
                     std::vector<ModuleInfo>& modules) -> void {
    if (filesystem.is_regular_file(directory / BUILD_DESCRIPTOR)) {
        modules.push_back(scan_module(filesystem, directory));
    }
    for (const auto& child : filesystem.list_directories(directory)) {
        if (should_descend(child)) {
            collect_modules(filesystem, child, modules);
        }
    }
}

} // namespace

auto scan_module(IFileSystem& filesystem, const std::filesystem::path& module_path) -> ModuleInfo {
    ModuleInfo info{
        .path = module_path,
        .base_name = functional_core::module_base_name(module_path),
    };

    auto present = [&](std::string_view role) { return filesystem.is_directory(info.submodule_path(role)); };

    info.has_api = present("api");
    info.has_core = present("core");
    info.has_spi = present("spi");
    info.has_facade = present("facade");
    info.has_submodules = info.has_layer_submodules() || present("common") || present("util");
    return info;
}

auto discover_modules(IFileSystem& filesystem, const std::filesystem::path& project_root)
    -> std::vector<ModuleInfo> {
    std::vector<ModuleInfo> modules;
    collect_modules(filesystem, project_root, modules);
    return modules;
}

auto read_packaging(IFileSystem& filesystem, const std::filesystem::path& module_path)
    -> std::optional<std::string> {
    auto descriptor = module_path / BUILD_DESCRIPTOR;
    if (!filesystem.is_regular_file(descriptor)) {
        return std::nullopt;
    }
    return functional_core::extract_xml_value(filesystem.read_file(descriptor), "packaging", "jar");
}

auto is_aggregator(IFileSystem& filesystem, const std::filesystem::path& module_path) -> bool {
    auto packaging = read_packaging(filesystem, module_path);
    return packaging && *packaging == AGGREGATOR_PACKAGING;
}

auto is_pure_aggregator(IFileSystem& filesystem, const ModuleInfo& module) -> bool {
    return !module.has_layer_submodules() && is_aggregator(filesystem, module.path);
}

} // namespace stratify

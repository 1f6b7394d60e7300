#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace stratify {

// Snapshot of a module directory and which layer submodules sit beside it.
// Submodules are named "<base>-<role>" and live inside the module directory.
struct ModuleInfo {
    std::filesystem::path path;
    std::string base_name;
    bool has_api = false;
    bool has_core = false;
    bool has_spi = false;
    bool has_facade = false;
    bool has_submodules = false;

    auto has_layer_submodules() const -> bool { return has_api || has_core || has_spi || has_facade; }

    auto submodule_path(std::string_view role) const -> std::filesystem::path {
        return path / (base_name + "-" + std::string(role));
    }

    auto operator==(const ModuleInfo& other) const -> bool = default;
};

} // namespace stratify

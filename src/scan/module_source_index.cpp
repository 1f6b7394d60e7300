#include "stratify/scan/module_source_index.hpp"

namespace stratify {

auto is_source_file(const std::filesystem::path& path) -> bool {
    return path.extension() == SOURCE_EXTENSION && path.filename() != PACKAGE_MARKER;
}

ModuleSourceIndex::ModuleSourceIndex(IFileSystem& filesystem) : filesystem_(filesystem) {}

auto ModuleSourceIndex::source_roots(const ModuleInfo& module) -> std::vector<std::filesystem::path> {
    std::vector<std::filesystem::path> candidates{module.path / SOURCE_DIRECTORY};

    struct Layer {
        std::string_view role;
        bool present;
    };
    for (const auto& layer : {Layer{"api", module.has_api}, Layer{"core", module.has_core},
                              Layer{"spi", module.has_spi}, Layer{"facade", module.has_facade}}) {
        if (layer.present) {
            candidates.push_back(layer_source_root(module, layer.role));
        }
    }

    std::vector<std::filesystem::path> roots;
    for (auto& candidate : candidates) {
        if (filesystem_.is_directory(candidate)) {
            roots.push_back(std::move(candidate));
        }
    }
    return roots;
}

auto ModuleSourceIndex::layer_source_root(const ModuleInfo& module, std::string_view role)
    -> std::filesystem::path {
    return module.submodule_path(role) / SOURCE_DIRECTORY;
}

auto ModuleSourceIndex::source_files(const std::filesystem::path& root)
    -> std::vector<std::filesystem::path> {
    std::vector<std::filesystem::path> files;
    for (auto& file : filesystem_.list_files(root)) {
        if (is_source_file(file)) {
            files.push_back(std::move(file));
        }
    }
    return files;
}

} // namespace stratify

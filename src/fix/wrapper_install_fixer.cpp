#include "stratify/fix/wrapper_install_fixer.hpp"
#include "stratify/backup/backup_transaction.hpp"

namespace stratify {

auto WrapperInstallFixer::name() const -> std::string {
    return "WrapperInstallFixer";
}

auto WrapperInstallFixer::description() const -> std::string {
    return "Installs Maven wrapper scripts and properties into pure aggregators";
}

auto WrapperInstallFixer::priority() const -> int {
    return PRIORITY;
}

auto WrapperInstallFixer::supported_rules() const -> std::vector<std::string> {
    return {"AG-005"};
}

auto WrapperInstallFixer::missing_assets(const std::filesystem::path& module_root,
                                         const FixerContext& context) -> std::vector<WrapperAsset> {
    std::vector<WrapperAsset> missing;
    for (const auto& asset : wrapper_assets()) {
        if (!context.filesystem.exists(module_root / asset.relative_path)) {
            missing.push_back(asset);
        }
    }
    return missing;
}

auto WrapperInstallFixer::target_files(const StructureViolation& violation, const FixerContext& context)
    -> std::vector<std::filesystem::path> {
    auto module_root = derive_module_root(violation, context);
    std::vector<std::filesystem::path> files;
    for (const auto& asset : missing_assets(module_root, context)) {
        files.push_back(module_root / asset.relative_path);
    }
    return files;
}

auto WrapperInstallFixer::fix(const StructureViolation& violation, const FixerContext& context) -> FixResult {
    if (!can_fix(violation)) {
        return fix_skipped(violation, "Not a wrapper presence violation");
    }

    auto module_root = derive_module_root(violation, context);
    auto missing = missing_assets(module_root, context);
    auto wrapper_directory = module_root / WRAPPER_DIRECTORY;
    bool directory_missing = !context.filesystem.is_directory(wrapper_directory);

    if (missing.empty() && !directory_missing) {
        return fix_skipped(violation, "All Maven wrapper files already exist");
    }

    std::vector<DiffPair> diffs;
    if (directory_missing) {
        diffs.push_back({.removed = "", .added = "create directory: " + std::string(WRAPPER_DIRECTORY)});
    }
    std::vector<std::filesystem::path> files;
    for (const auto& asset : missing) {
        diffs.push_back({.removed = "", .added = "create: " + std::string(asset.relative_path)});
        files.push_back(module_root / asset.relative_path);
    }

    auto summary = "Install Maven wrapper (" + std::to_string(missing.size())
                   + (missing.size() == 1 ? " file)" : " files)");

    if (context.dry_run) {
        return fix_applied(violation, true, summary, files, std::move(diffs));
    }

    auto install = [&] {
        context.filesystem.create_directories(wrapper_directory);
        for (const auto& asset : missing) {
            auto target = module_root / asset.relative_path;
            context.filesystem.create_directories(target.parent_path());
            context.filesystem.write_file(target, std::string(asset.content));
            if (asset.executable && !context.filesystem.set_executable(target)) {
                context.log.warn("Could not mark " + target.string() + " executable");
            }
        }
    };

    if (context.backup) {
        BackupTransaction transaction(*context.backup, files, context.project_root);
        install();
        transaction.commit();
    } else {
        install();
    }

    context.log.info("Installed Maven wrapper in " + module_root.string());
    return fix_applied(violation, false, summary, files, std::move(diffs));
}

} // namespace stratify

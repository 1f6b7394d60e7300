#include "stratify/fix/facade_return_type_fixer.hpp"
#include "stratify/backup/backup_transaction.hpp"
#include "stratify/core/source_patch.hpp"
#include "stratify/scan/module_source_index.hpp"

namespace stratify {

auto FacadeReturnTypeFixer::name() const -> std::string {
    return "FacadeReturnTypeFixer";
}

auto FacadeReturnTypeFixer::description() const -> std::string {
    return "Replaces core implementation return types in facade methods with API interfaces";
}

auto FacadeReturnTypeFixer::priority() const -> int {
    return PRIORITY;
}

auto FacadeReturnTypeFixer::supported_rules() const -> std::vector<std::string> {
    return {"FA-002"};
}

auto FacadeReturnTypeFixer::resolve_source_file(const StructureViolation& violation,
                                                const FixerContext& context)
    -> std::optional<std::filesystem::path> {
    auto location = resolve_location(violation, context);
    auto& filesystem = context.filesystem;

    if (filesystem.is_regular_file(location)) {
        return location;
    }
    if (filesystem.is_directory(location)) {
        for (const auto& file : filesystem.list_files(location)) {
            if (is_source_file(file)) {
                return file;
            }
        }
    }
    return std::nullopt;
}

auto FacadeReturnTypeFixer::target_files(const StructureViolation& violation, const FixerContext& context)
    -> std::vector<std::filesystem::path> {
    if (auto file = resolve_source_file(violation, context)) {
        return {*file};
    }
    return {};
}

auto FacadeReturnTypeFixer::fix(const StructureViolation& violation, const FixerContext& context)
    -> FixResult {
    if (!can_fix(violation)) {
        return fix_skipped(violation, "Not an FA-002 violation");
    }

    auto file = resolve_source_file(violation, context);
    if (!file) {
        return fix_skipped(violation,
                           "Could not determine source file from violation: " + violation.location.string());
    }

    auto core_type = source_patch::extract_core_type(violation.message, context.type_mappings);
    if (!core_type) {
        return fix_skipped(violation, "Could not determine core type from violation message");
    }

    auto mapping = resolve_mapping(context.type_mappings, *core_type);
    if (!mapping) {
        return fix_skipped(violation, "No API interface mapping found for: " + *core_type);
    }

    auto original = context.filesystem.read_file(*file);
    auto patch = source_patch::rewrite_return_types(original, *core_type, *mapping);
    if (patch.replacements == 0) {
        return fix_skipped(violation, "No changes needed - return type already correct or not found");
    }
    auto updated = source_patch::reconcile_imports(patch.content, *core_type, *mapping, patch.diffs);

    auto summary = "Change return type from " + *core_type + " to " + mapping->api_simple_name();
    if (mapping->inferred) {
        summary += " (inferred mapping, verify imports)";
    }

    if (context.dry_run) {
        return fix_applied(violation, true, summary, {*file}, std::move(patch.diffs));
    }

    if (context.backup) {
        BackupTransaction transaction(*context.backup, {*file}, context.project_root);
        context.filesystem.write_file(*file, updated);
        transaction.commit();
    } else {
        context.filesystem.write_file(*file, updated);
    }

    context.log.info("Updated " + file->string() + ": " + summary);
    return fix_applied(violation, false, summary, {*file}, std::move(patch.diffs));
}

} // namespace stratify

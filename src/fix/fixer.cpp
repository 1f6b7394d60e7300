#include "stratify/fix/fixer.hpp"
#include "stratify/scan/module_scanner.hpp"

namespace stratify {

auto resolve_location(const StructureViolation& violation, const FixerContext& context)
    -> std::filesystem::path {
    if (violation.location.empty()) {
        return context.module_root;
    }
    if (violation.location.is_absolute()) {
        return violation.location.lexically_normal();
    }
    return (context.project_root / violation.location).lexically_normal();
}

auto derive_module_root(const StructureViolation& violation, const FixerContext& context)
    -> std::filesystem::path {
    auto location = resolve_location(violation, context);
    auto candidate = context.filesystem.is_directory(location) ? location : location.parent_path();
    auto root = context.project_root.lexically_normal();

    for (; !candidate.empty(); candidate = candidate.parent_path()) {
        if (context.filesystem.is_regular_file(candidate / BUILD_DESCRIPTOR)) {
            return candidate;
        }
        if (candidate == root || candidate == candidate.root_path()) {
            break;
        }
    }
    return context.module_root;
}

} // namespace stratify

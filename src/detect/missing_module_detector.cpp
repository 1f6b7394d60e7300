#include "stratify/detect/missing_module_detector.hpp"
#include "stratify/errors.hpp"
#include "stratify/scan/module_scanner.hpp"

namespace stratify {

namespace {

auto missing_layer(const ModuleInfo& module, const std::string& rule_id, const std::string& role,
                   const std::string& purpose) -> StructureViolation {
    auto submodule = module.base_name + "-" + role;
    return StructureViolation{
        .rule_id = rule_id,
        .rule_category = category_for_rule(rule_id),
        .message = (role == "api" ? "API" : "Core") + std::string(" module '") + submodule
                   + "' must exist. " + purpose,
        .location = module.path,
        .found = "No " + submodule + " directory in " + module.base_name,
        .expected = submodule + " submodule declared in " + std::string(BUILD_DESCRIPTOR),
        .suggested_fix = "Create " + submodule + " with its own " + std::string(BUILD_DESCRIPTOR)
                         + " and register it in the parent's <modules> section",
        .reference = "module-structure.md § " + rule_id,
        .severity = Severity::ERROR,
    };
}

} // namespace

MissingModuleDetector::MissingModuleDetector(IFileSystem& filesystem) : filesystem_(filesystem) {}

auto MissingModuleDetector::name() const -> std::string {
    return "MissingModuleDetector";
}

auto MissingModuleDetector::rule_ids() const -> std::vector<std::string> {
    return {"MS-001", "MS-002"};
}

auto MissingModuleDetector::detect(const ModuleInfo& module) -> std::vector<StructureViolation> {
    std::vector<StructureViolation> violations;
    if (!module.has_layer_submodules()) {
        return violations;
    }

    try {
        if (!is_aggregator(filesystem_, module.path)) {
            return violations;
        }
    } catch (const IoError&) {
        return violations;
    }

    if (!module.has_api) {
        violations.push_back(missing_layer(module, "MS-001", "api",
                                           "All standard modules require an API module for public "
                                           "contracts (interfaces, DTOs, exceptions)."));
    }
    if (!module.has_core) {
        violations.push_back(missing_layer(module, "MS-002", "core",
                                           "All standard modules require a Core module for "
                                           "implementations of the API contracts."));
    }
    return violations;
}

} // namespace stratify

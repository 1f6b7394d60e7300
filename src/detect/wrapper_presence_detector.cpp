#include "stratify/detect/wrapper_presence_detector.hpp"
#include "stratify/core/functional_core.hpp"
#include "stratify/errors.hpp"
#include "stratify/fix/wrapper_templates.hpp"
#include "stratify/scan/module_scanner.hpp"

namespace stratify {

namespace {

auto missing_item(const ModuleInfo& module, const std::string& artifact,
                  const std::filesystem::path& location, const std::string& message) -> StructureViolation {
    return StructureViolation{
        .rule_id = "AG-005",
        .rule_category = category_for_rule("AG-005"),
        .message = "Pure aggregator '" + artifact + "' must have " + message,
        .location = location,
        .found = "Missing " + location.lexically_relative(module.path).generic_string(),
        .expected = "Maven wrapper files present in " + module.base_name,
        .suggested_fix = "Run 'mvn wrapper:wrapper' in the aggregator or let the wrapper fixer install the files",
        .reference = "aggregator-design.md § AG-005",
        .severity = Severity::WARNING,
    };
}

} // namespace

WrapperPresenceDetector::WrapperPresenceDetector(IFileSystem& filesystem) : filesystem_(filesystem) {}

auto WrapperPresenceDetector::name() const -> std::string {
    return "WrapperPresenceDetector";
}

auto WrapperPresenceDetector::rule_ids() const -> std::vector<std::string> {
    return {"AG-005"};
}

auto WrapperPresenceDetector::detect(const ModuleInfo& module) -> std::vector<StructureViolation> {
    std::vector<StructureViolation> violations;

    std::string artifact;
    try {
        if (!is_pure_aggregator(filesystem_, module)) {
            return violations;
        }
        artifact = functional_core::extract_xml_value(
            filesystem_.read_file(module.path / BUILD_DESCRIPTOR), "artifactId", module.base_name);
    } catch (const IoError&) {
        return violations;
    }

    const auto& base = module.path;
    if (!filesystem_.exists(base / WRAPPER_SCRIPT)) {
        violations.push_back(missing_item(module, artifact, base / WRAPPER_SCRIPT,
                                          "Maven wrapper script '" + std::string(WRAPPER_SCRIPT)
                                              + "'. Maven wrapper ensures reproducible builds "
                                                "without requiring Maven installation."));
    }
    if (!filesystem_.exists(base / WRAPPER_BATCH_SCRIPT)) {
        violations.push_back(missing_item(module, artifact, base / WRAPPER_BATCH_SCRIPT,
                                          "Maven wrapper batch script '"
                                              + std::string(WRAPPER_BATCH_SCRIPT)
                                              + "' for Windows support."));
    }
    if (!filesystem_.is_directory(base / WRAPPER_DIRECTORY)) {
        violations.push_back(missing_item(module, artifact, base / WRAPPER_DIRECTORY,
                                          "Maven wrapper directory '" + std::string(WRAPPER_DIRECTORY)
                                              + "' with maven-wrapper.properties."));
    } else if (!filesystem_.exists(base / WRAPPER_PROPERTIES)) {
        violations.push_back(missing_item(module, artifact, base / WRAPPER_PROPERTIES,
                                          "Maven wrapper properties '" + std::string(WRAPPER_PROPERTIES)
                                              + "'."));
    }
    return violations;
}

} // namespace stratify

#include "stratify/detect/facade_return_type_detector.hpp"
#include "stratify/errors.hpp"
#include "stratify/java/source_index.hpp"

namespace stratify {

FacadeReturnTypeDetector::FacadeReturnTypeDetector(IFileSystem& filesystem, TypeMappingTable mappings)
    : filesystem_(filesystem), mappings_(std::move(mappings)), source_index_(filesystem) {}

auto FacadeReturnTypeDetector::name() const -> std::string {
    return "FacadeReturnTypeDetector";
}

auto FacadeReturnTypeDetector::rule_ids() const -> std::vector<std::string> {
    return {"FA-002"};
}

auto FacadeReturnTypeDetector::detect(const ModuleInfo& module) -> std::vector<StructureViolation> {
    std::vector<StructureViolation> violations;
    if (!module.has_facade) {
        return violations;
    }

    std::vector<std::filesystem::path> files;
    try {
        files = source_index_.source_files(source_index_.layer_source_root(module, "facade"));
    } catch (const IoError&) {
        return violations;
    }

    for (const auto& file : files) {
        try {
            auto found = analyze_source(file, filesystem_.read_file(file));
            violations.insert(violations.end(), found.begin(), found.end());
        } catch (const java::ParseError&) {
            continue;
        } catch (const IoError&) {
            continue;
        }
    }
    return violations;
}

auto FacadeReturnTypeDetector::analyze_source(const std::filesystem::path& file,
                                              std::string_view source) const
    -> std::vector<StructureViolation> {
    std::vector<StructureViolation> violations;
    auto index = java::parse_source(source);

    for (const auto& type : index.types) {
        if (type.is_interface()) {
            continue;
        }
        for (const auto& method : type.methods) {
            if (!method.has_modifier("public") || !is_core_type(method.return_type)) {
                continue;
            }

            auto mapping = resolve_mapping(mappings_, method.return_type);
            auto api_type = mapping ? mapping->api_simple_name() : std::string("its API interface");

            violations.push_back(StructureViolation{
                .rule_id = "FA-002",
                .rule_category = category_for_rule("FA-002"),
                .message = "Method " + method.name + "() returns " + method.return_type
                           + " instead of an API type",
                .location = file,
                .found = type.name + "." + method.name + "() returns " + method.return_type + " at line "
                         + std::to_string(method.line),
                .expected = type.name + "." + method.name + "() should return " + api_type,
                .suggested_fix = "Change the return type to " + api_type
                                 + " and import it from the API module",
                .reference = "facade-design.md § FA-002",
                .severity = Severity::WARNING,
            });
        }
    }
    return violations;
}

auto FacadeReturnTypeDetector::is_core_type(const std::string& type_name) const -> bool {
    return mappings_.contains(type_name) || is_core_type_name(type_name);
}

} // namespace stratify

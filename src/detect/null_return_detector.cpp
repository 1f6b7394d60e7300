#include "stratify/detect/null_return_detector.hpp"
#include "stratify/errors.hpp"

namespace stratify {

NullReturnDetector::NullReturnDetector(IFileSystem& filesystem, NullReturnRule rule)
    : filesystem_(filesystem),
      rule_(std::move(rule)),
      matcher_{.capability_interfaces = {rule_.capability_interface},
               .base_classes = {rule_.abstract_base}},
      source_index_(filesystem) {}

auto NullReturnDetector::name() const -> std::string {
    return "NullReturnDetector";
}

auto NullReturnDetector::rule_ids() const -> std::vector<std::string> {
    return {rule_.rule_id};
}

auto NullReturnDetector::detect(const ModuleInfo& module) -> std::vector<StructureViolation> {
    std::vector<StructureViolation> violations;

    // Only multi-module layouts are subject to this rule
    if (!module.has_submodules) {
        return violations;
    }

    for (const auto& root : source_index_.source_roots(module)) {
        std::vector<std::filesystem::path> files;
        try {
            files = source_index_.source_files(root);
        } catch (const IoError&) {
            continue;
        }
        for (const auto& file : files) {
            auto found = analyze_file(file);
            violations.insert(violations.end(), found.begin(), found.end());
        }
    }
    return violations;
}

auto NullReturnDetector::analyze_file(const std::filesystem::path& file)
    -> std::vector<StructureViolation> {
    try {
        return analyze_source(file, filesystem_.read_file(file));
    } catch (const java::ParseError&) {
        return {};
    } catch (const IoError&) {
        return {};
    }
}

auto NullReturnDetector::analyze_source(const std::filesystem::path& file, std::string_view source) const
    -> std::vector<StructureViolation> {
    std::vector<StructureViolation> violations;
    auto index = java::parse_source(source, matcher_);

    for (const auto& type : index.types) {
        if (type.is_interface() || type.role == java::ClassRole::PLAIN) {
            continue;
        }
        auto methods = type.find_methods(rule_.method_name, rule_.method_arity);
        if (methods.empty()) {
            continue;
        }
        // The first declaration with the contract arity is the one inspected
        if (auto line = methods.front()->first_null_return()) {
            violations.push_back(make_violation(file, type.name, line));
        }
    }
    return violations;
}

auto NullReturnDetector::make_violation(const std::filesystem::path& file,
                                        const std::string& class_name,
                                        std::optional<size_t> line) const -> StructureViolation {
    auto qualified_method = class_name + "." + rule_.method_name + "()";
    auto found = qualified_method + " returns null";
    if (line) {
        found += " at line " + std::to_string(*line);
    }

    return StructureViolation{
        .rule_id = rule_.rule_id,
        .rule_category = rule_.category,
        .message = rule_.capability_interface + " " + rule_.method_name + "() method must not return null",
        .location = file,
        .found = found,
        .expected = qualified_method + " should return " + rule_.result_type,
        .suggested_fix = "Replace 'return null;' with an appropriate " + rule_.result_type
                         + " factory method:\n\n"
                           "For successful fixes:\n"
                           "  return "
                         + rule_.result_type
                         + ".success(violation, modifiedFiles, \"Description of fix\");\n\n"
                           "For failed fixes:\n"
                           "  return "
                         + rule_.result_type
                         + ".failed(violation, \"Error message explaining why it failed\");\n\n"
                           "For skipped fixes:\n"
                           "  return "
                         + rule_.result_type + ".skipped(violation, \"Reason for skipping\");",
        .reference = "remediation-design.md § " + rule_.rule_id,
        .severity = Severity::ERROR,
    };
}

} // namespace stratify

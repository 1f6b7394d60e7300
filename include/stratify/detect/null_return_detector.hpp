#pragma once

#include "stratify/detect/rule_detector.hpp"
#include "stratify/interfaces.hpp"
#include "stratify/java/source_index.hpp"
#include "stratify/scan/module_source_index.hpp"
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace stratify {

// Which classes and which contract method the null-return rule looks at
struct NullReturnRule {
    std::string rule_id = "FX-002";
    std::string category = "FixerDesign";
    std::string capability_interface = "Fixer";
    std::string abstract_base = "AbstractStructureFixer";
    std::string method_name = "fix";
    std::string result_type = "FixResult";
    size_t method_arity = 2;
};

// Flags capability implementations whose contract method returns the null literal
class NullReturnDetector : public IRuleDetector {
public:
    explicit NullReturnDetector(IFileSystem& filesystem, NullReturnRule rule = {});

    auto name() const -> std::string override;
    auto rule_ids() const -> std::vector<std::string> override;
    auto detect(const ModuleInfo& module) -> std::vector<StructureViolation> override;

    // Pure analysis of one compilation unit. Throws java::ParseError.
    auto analyze_source(const std::filesystem::path& file, std::string_view source) const
        -> std::vector<StructureViolation>;

private:
    auto analyze_file(const std::filesystem::path& file) -> std::vector<StructureViolation>;
    auto make_violation(const std::filesystem::path& file, const std::string& class_name,
                        std::optional<size_t> line) const -> StructureViolation;

    IFileSystem& filesystem_;
    NullReturnRule rule_;
    java::CapabilityMatcher matcher_;
    ModuleSourceIndex source_index_;
};

} // namespace stratify

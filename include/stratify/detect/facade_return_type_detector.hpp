#pragma once

#include "stratify/core/type_mapping.hpp"
#include "stratify/detect/rule_detector.hpp"
#include "stratify/interfaces.hpp"
#include "stratify/scan/module_source_index.hpp"
#include <filesystem>
#include <string_view>

namespace stratify {

// FA-002: public facade methods must expose API interfaces, not core implementations
class FacadeReturnTypeDetector : public IRuleDetector {
public:
    FacadeReturnTypeDetector(IFileSystem& filesystem, TypeMappingTable mappings);

    auto name() const -> std::string override;
    auto rule_ids() const -> std::vector<std::string> override;
    auto detect(const ModuleInfo& module) -> std::vector<StructureViolation> override;

    // Throws java::ParseError
    auto analyze_source(const std::filesystem::path& file, std::string_view source) const
        -> std::vector<StructureViolation>;

private:
    auto is_core_type(const std::string& type_name) const -> bool;

    IFileSystem& filesystem_;
    TypeMappingTable mappings_;
    ModuleSourceIndex source_index_;
};

} // namespace stratify

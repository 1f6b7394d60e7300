#pragma once

#include "stratify/detect/rule_detector.hpp"
#include "stratify/interfaces.hpp"

namespace stratify {

// MS-001 / MS-002: a layered parent module must carry "<base>-api" and "<base>-core".
// Pure aggregators (no layer submodules at all) are exempt.
class MissingModuleDetector : public IRuleDetector {
public:
    explicit MissingModuleDetector(IFileSystem& filesystem);

    auto name() const -> std::string override;
    auto rule_ids() const -> std::vector<std::string> override;
    auto detect(const ModuleInfo& module) -> std::vector<StructureViolation> override;

private:
    IFileSystem& filesystem_;
};

} // namespace stratify

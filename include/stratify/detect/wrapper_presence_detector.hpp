#pragma once

#include "stratify/detect/rule_detector.hpp"
#include "stratify/interfaces.hpp"

namespace stratify {

// AG-005: pure aggregators ship a build wrapper. One violation per missing item.
class WrapperPresenceDetector : public IRuleDetector {
public:
    explicit WrapperPresenceDetector(IFileSystem& filesystem);

    auto name() const -> std::string override;
    auto rule_ids() const -> std::vector<std::string> override;
    auto detect(const ModuleInfo& module) -> std::vector<StructureViolation> override;

private:
    IFileSystem& filesystem_;
};

} // namespace stratify

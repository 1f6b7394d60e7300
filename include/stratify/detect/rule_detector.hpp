#pragma once

#include "stratify/core/module_info.hpp"
#include "stratify/core/violation.hpp"
#include <string>
#include <vector>

namespace stratify {

// Inspects one module and reports rule breaches. Implementations never let
// an unreadable or unparseable file escape; such files are skipped.
class IRuleDetector {
public:
    virtual ~IRuleDetector() = default;
    virtual auto name() const -> std::string = 0;
    virtual auto rule_ids() const -> std::vector<std::string> = 0;
    virtual auto detect(const ModuleInfo& module) -> std::vector<StructureViolation> = 0;
};

} // namespace stratify

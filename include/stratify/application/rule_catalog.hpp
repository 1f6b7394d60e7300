#pragma once

#include "stratify/core/type_mapping.hpp"
#include "stratify/detect/rule_detector.hpp"
#include "stratify/fix/fixer_registry.hpp"
#include "stratify/interfaces.hpp"
#include <memory>
#include <vector>

namespace stratify {

// Default detectors and fixers shipped with the tool
class RuleCatalog {
public:
    static auto default_detectors(IFileSystem& filesystem, const TypeMappingTable& mappings)
        -> std::vector<std::unique_ptr<IRuleDetector>>;

    static auto default_fixers() -> FixerRegistry;
};

} // namespace stratify

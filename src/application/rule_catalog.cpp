#include "stratify/application/rule_catalog.hpp"
#include "stratify/detect/facade_return_type_detector.hpp"
#include "stratify/detect/missing_module_detector.hpp"
#include "stratify/detect/null_return_detector.hpp"
#include "stratify/detect/wrapper_presence_detector.hpp"
#include "stratify/fix/facade_return_type_fixer.hpp"
#include "stratify/fix/missing_module_fixer.hpp"
#include "stratify/fix/wrapper_install_fixer.hpp"

namespace stratify {

auto RuleCatalog::default_detectors(IFileSystem& filesystem, const TypeMappingTable& mappings)
    -> std::vector<std::unique_ptr<IRuleDetector>> {
    std::vector<std::unique_ptr<IRuleDetector>> detectors;
    detectors.push_back(std::make_unique<MissingModuleDetector>(filesystem));
    detectors.push_back(std::make_unique<WrapperPresenceDetector>(filesystem));
    detectors.push_back(std::make_unique<FacadeReturnTypeDetector>(filesystem, mappings));
    detectors.push_back(std::make_unique<NullReturnDetector>(filesystem));
    return detectors;
}

auto RuleCatalog::default_fixers() -> FixerRegistry {
    FixerRegistry registry;
    registry.register_fixer(std::make_unique<MissingModuleFixer>());
    registry.register_fixer(std::make_unique<WrapperInstallFixer>());
    registry.register_fixer(std::make_unique<FacadeReturnTypeFixer>());
    return registry;
}

} // namespace stratify

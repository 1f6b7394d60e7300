#pragma once

#include "stratify/fix/fixer.hpp"
#include "stratify/fix/wrapper_templates.hpp"

namespace stratify {

// AG-005: installs the build wrapper files a pure aggregator is missing.
// Files already present are never touched.
class WrapperInstallFixer : public IFixer {
public:
    static constexpr int PRIORITY = 80;

    auto name() const -> std::string override;
    auto description() const -> std::string override;
    auto priority() const -> int override;
    auto supported_rules() const -> std::vector<std::string> override;
    auto target_files(const StructureViolation& violation, const FixerContext& context)
        -> std::vector<std::filesystem::path> override;
    auto fix(const StructureViolation& violation, const FixerContext& context) -> FixResult override;

private:
    auto missing_assets(const std::filesystem::path& module_root, const FixerContext& context)
        -> std::vector<WrapperAsset>;
};

} // namespace stratify

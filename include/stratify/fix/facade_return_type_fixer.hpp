#pragma once

#include "stratify/fix/fixer.hpp"
#include <optional>

namespace stratify {

// FA-002: rewrites facade method signatures that expose a core implementation
// type so they return the matching API interface, then reconciles imports.
class FacadeReturnTypeFixer : public IFixer {
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
    // A regular file is used directly; a directory yields its first source file
    auto resolve_source_file(const StructureViolation& violation, const FixerContext& context)
        -> std::optional<std::filesystem::path>;
};

} // namespace stratify

#pragma once

#include "stratify/backup/backup_strategy.hpp"
#include "stratify/core/fix_result.hpp"
#include "stratify/core/type_mapping.hpp"
#include "stratify/core/violation.hpp"
#include "stratify/interfaces.hpp"
#include <algorithm>
#include <filesystem>
#include <string>
#include <vector>

namespace stratify {

inline constexpr int DEFAULT_FIXER_PRIORITY = 50;

// Everything a fixer may consult while repairing one violation
struct FixerContext {
    std::filesystem::path project_root;
    std::filesystem::path module_root;
    bool dry_run = false;
    ILogSink& log;
    IFileSystem& filesystem;
    const TypeMappingTable& type_mappings;
    std::string base_namespace = "dev.engineeringlab";
    std::string project_name = "architecture";
    IBackupStrategy* backup = nullptr;  // Set when the fixer should guard its own writes
};

// Repairs violations of the rules it declares. fix() reports every outcome it
// can foresee through FixResult; unexpected faults may escape as exceptions and
// are contained by the orchestrator.
class IFixer {
public:
    virtual ~IFixer() = default;
    virtual auto name() const -> std::string = 0;
    virtual auto description() const -> std::string = 0;
    virtual auto priority() const -> int = 0;
    virtual auto supported_rules() const -> std::vector<std::string> = 0;

    virtual auto can_fix(const StructureViolation& violation) const -> bool {
        auto rules = supported_rules();
        return std::find(rules.begin(), rules.end(), violation.rule_id) != rules.end();
    }

    // Files fix() may create or modify, known before anything is touched
    virtual auto target_files(const StructureViolation& violation, const FixerContext& context)
        -> std::vector<std::filesystem::path> = 0;

    virtual auto fix(const StructureViolation& violation, const FixerContext& context) -> FixResult = 0;
};

// Absolute form of a violation location
auto resolve_location(const StructureViolation& violation, const FixerContext& context)
    -> std::filesystem::path;

// Nearest directory at or above the violation location holding a build descriptor,
// falling back to the context's module root
auto derive_module_root(const StructureViolation& violation, const FixerContext& context)
    -> std::filesystem::path;

} // namespace stratify

#pragma once

#include "stratify/backup/backup_strategy.hpp"
#include "stratify/core/fix_result.hpp"
#include "stratify/fix/fixer.hpp"
#include "stratify/fix/fixer_registry.hpp"
#include <set>
#include <string>
#include <vector>

namespace stratify {

struct OrchestratorOptions {
    bool fallthrough_on_skip = false;  // Try the next candidate when a fixer skips
    size_t max_failures = 0;           // 0 disables abandonment
    size_t jobs = 1;                   // Fixes with disjoint target files may run concurrently
    std::set<std::string, std::less<>> disabled_rules;
    std::set<std::string, std::less<>> disabled_fixers;
};

struct FixSummary {
    size_t fixed{};
    size_t skipped{};
    size_t failed{};
    size_t dry_run{};

    auto total() const -> size_t { return fixed + skipped + failed + dry_run; }
    auto operator==(const FixSummary& other) const -> bool = default;
};

auto summarize(const std::vector<FixResult>& results) -> FixSummary;

// Applies registered fixers to violations. Every mutation runs inside a backup
// transaction; a fixer that throws or reports FAILED leaves its targets exactly
// as they were. No exception escapes fix_all() or fix_one().
class RemediationOrchestrator {
public:
    RemediationOrchestrator(const FixerRegistry& registry, IBackupStrategy& backup,
                            OrchestratorOptions options = {});

    // One result per violation of an enabled rule, in rule id order
    auto fix_all(const std::vector<StructureViolation>& violations, const FixerContext& context)
        -> std::vector<FixResult>;

    auto fix_one(const StructureViolation& violation, const FixerContext& context) -> FixResult;

private:
    struct WorkItem {
        const StructureViolation* violation = nullptr;
        std::vector<IFixer*> fixers;
        std::vector<std::filesystem::path> targets;
    };

    auto candidates_for(const StructureViolation& violation) const -> std::vector<IFixer*>;
    auto run_item(const WorkItem& item, const FixerContext& context) -> FixResult;
    auto run_transaction(IFixer& fixer, const StructureViolation& violation, const FixerContext& context)
        -> FixResult;
    auto collect_targets(const std::vector<IFixer*>& fixers, const StructureViolation& violation,
                         const FixerContext& context) -> std::vector<std::filesystem::path>;
    auto next_wave(const std::vector<WorkItem>& items, std::vector<bool>& scheduled) const
        -> std::vector<size_t>;
    auto log_summary(const std::vector<FixResult>& results, const FixerContext& context) const -> void;

    const FixerRegistry& registry_;
    IBackupStrategy& backup_;
    OrchestratorOptions options_;
};

} // namespace stratify

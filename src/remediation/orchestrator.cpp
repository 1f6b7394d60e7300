#include "stratify/remediation/orchestrator.hpp"
#include "stratify/backup/backup_transaction.hpp"
#include <algorithm>
#include <future>
#include <map>
#include <optional>

namespace stratify {

namespace {

auto overlaps(const std::vector<std::filesystem::path>& a, const std::vector<std::filesystem::path>& b)
    -> bool {
    return std::any_of(a.begin(), a.end(),
                       [&](const auto& path) { return std::find(b.begin(), b.end(), path) != b.end(); });
}

} // namespace

auto summarize(const std::vector<FixResult>& results) -> FixSummary {
    FixSummary summary;
    for (const auto& result : results) {
        switch (result.status) {
        case FixStatus::FIXED:
            ++summary.fixed;
            break;
        case FixStatus::SKIPPED:
            ++summary.skipped;
            break;
        case FixStatus::FAILED:
            ++summary.failed;
            break;
        case FixStatus::DRY_RUN:
            ++summary.dry_run;
            break;
        }
    }
    return summary;
}

RemediationOrchestrator::RemediationOrchestrator(const FixerRegistry& registry, IBackupStrategy& backup,
                                                 OrchestratorOptions options)
    : registry_(registry), backup_(backup), options_(std::move(options)) {}

auto RemediationOrchestrator::candidates_for(const StructureViolation& violation) const
    -> std::vector<IFixer*> {
    auto candidates = registry_.fixers_for(violation);
    std::erase_if(candidates,
                  [&](const IFixer* fixer) { return options_.disabled_fixers.contains(fixer->name()); });
    return candidates;
}

auto RemediationOrchestrator::fix_one(const StructureViolation& violation, const FixerContext& context)
    -> FixResult {
    if (options_.disabled_rules.contains(violation.rule_id)) {
        return fix_skipped(violation, "Rule disabled by configuration: " + violation.rule_id);
    }
    auto fixers = candidates_for(violation);
    if (fixers.empty()) {
        return fix_skipped(violation, "No fixer registered for rule: " + violation.rule_id);
    }
    return run_item(WorkItem{.violation = &violation, .fixers = std::move(fixers)}, context);
}

auto RemediationOrchestrator::fix_all(const std::vector<StructureViolation>& violations,
                                      const FixerContext& context) -> std::vector<FixResult> {
    // Group by rule so each rule's fixers are resolved once
    std::map<std::string, std::vector<const StructureViolation*>> by_rule;
    for (const auto& violation : violations) {
        by_rule[violation.rule_id].push_back(&violation);
    }

    std::vector<std::optional<FixResult>> slots;
    std::vector<WorkItem> items;
    std::vector<size_t> item_slot;

    for (const auto& [rule_id, group] : by_rule) {
        if (options_.disabled_rules.contains(rule_id)) {
            context.log.info("Skipping disabled rule " + rule_id);
            continue;
        }
        for (const auto* violation : group) {
            auto fixers = candidates_for(*violation);
            if (fixers.empty()) {
                slots.push_back(fix_skipped(*violation, "No fixer registered for rule: " + rule_id));
                continue;
            }
            slots.emplace_back();
            item_slot.push_back(slots.size() - 1);
            items.push_back(WorkItem{
                .violation = violation,
                .fixers = fixers,
                .targets = options_.jobs > 1 ? collect_targets(fixers, *violation, context)
                                             : std::vector<std::filesystem::path>{},
            });
        }
    }

    size_t failures = 0;
    std::vector<bool> scheduled(items.size(), false);
    auto remaining = items.size();

    auto record = [&](size_t index, FixResult result) {
        if (result.status == FixStatus::FAILED) {
            ++failures;
        }
        slots[item_slot[index]] = std::move(result);
    };
    auto abandoned = [&] { return options_.max_failures > 0 && failures >= options_.max_failures; };

    while (remaining > 0 && !abandoned()) {
        std::vector<size_t> wave;
        if (options_.jobs > 1) {
            wave = next_wave(items, scheduled);
        } else {
            auto next = std::find(scheduled.begin(), scheduled.end(), false);
            auto index = static_cast<size_t>(std::distance(scheduled.begin(), next));
            scheduled[index] = true;
            wave.push_back(index);
        }
        remaining -= wave.size();

        if (wave.size() == 1) {
            record(wave.front(), run_item(items[wave.front()], context));
            continue;
        }

        // Run the wave in batches of at most `jobs` concurrent fixes
        for (size_t start = 0; start < wave.size(); start += options_.jobs) {
            auto end = std::min(wave.size(), start + options_.jobs);
            std::vector<std::future<FixResult>> running;
            for (size_t i = start; i < end; ++i) {
                const auto& item = items[wave[i]];
                running.push_back(std::async(std::launch::async,
                                             [this, &item, &context] { return run_item(item, context); }));
            }
            for (size_t i = start; i < end; ++i) {
                record(wave[i], running[i - start].get());
            }
        }
    }

    if (remaining > 0) {
        context.log.error("Abandoning remediation after " + std::to_string(failures) + " failures");
        for (size_t i = 0; i < items.size(); ++i) {
            if (!scheduled[i]) {
                slots[item_slot[i]] = fix_skipped(*items[i].violation,
                                                  "Abandoned after " + std::to_string(failures) + " failures");
            }
        }
    }

    std::vector<FixResult> results;
    results.reserve(slots.size());
    for (auto& slot : slots) {
        results.push_back(std::move(*slot));
    }
    log_summary(results, context);
    return results;
}

auto RemediationOrchestrator::run_item(const WorkItem& item, const FixerContext& context) -> FixResult {
    std::optional<FixResult> last;
    for (size_t i = 0; i < item.fixers.size(); ++i) {
        auto* fixer = item.fixers[i];
        last = run_transaction(*fixer, *item.violation, context);
        bool more = i + 1 < item.fixers.size();
        if (last->status == FixStatus::SKIPPED && options_.fallthrough_on_skip && more) {
            context.log.info(fixer->name() + " skipped " + item.violation->rule_id + ", trying next fixer");
            continue;
        }
        break;
    }
    return std::move(*last);
}

auto RemediationOrchestrator::run_transaction(IFixer& fixer, const StructureViolation& violation,
                                              const FixerContext& context) -> FixResult {
    context.log.info("Running " + fixer.name() + " for " + violation.rule_id + " at "
                     + violation.location.string());

    if (context.dry_run) {
        try {
            return fixer.fix(violation, context);
        } catch (const std::exception& e) {
            context.log.error(fixer.name() + " failed: " + e.what());
            return fix_failed(violation, e.what());
        }
    }

    std::vector<std::filesystem::path> targets;
    try {
        targets = fixer.target_files(violation, context);
    } catch (const std::exception& e) {
        context.log.error(fixer.name() + " could not plan its changes: " + e.what());
        return fix_failed(violation, std::string("Could not determine target files: ") + e.what());
    }

    std::optional<BackupTransaction> transaction;
    try {
        transaction.emplace(backup_, targets, context.project_root);
    } catch (const std::exception& e) {
        context.log.error("Backup failed before " + fixer.name() + ": " + e.what());
        return fix_failed(violation, std::string("Backup failed: ") + e.what());
    }

    auto restore = [&](const std::string& reason) {
        context.log.error(fixer.name() + " failed, rolling back: " + reason);
        for (const auto& restored : transaction->rollback()) {
            if (!restored.success) {
                context.log.error("Could not restore " + restored.target_path.string() + ": "
                                  + restored.message.value_or("unknown error"));
                if (!restored.backup_path.empty()) {
                    context.log.error("Backup kept at " + restored.backup_path.string());
                }
            }
        }
    };

    try {
        auto result = fixer.fix(violation, context);
        if (result.status == FixStatus::FAILED) {
            restore(result.error_message.empty() ? result.description : result.error_message);
            result.modified_files.clear();
            return result;
        }
        transaction->commit();
        return result;
    } catch (const std::exception& e) {
        restore(e.what());
        return fix_failed(violation, e.what());
    }
}

auto RemediationOrchestrator::collect_targets(const std::vector<IFixer*>& fixers,
                                              const StructureViolation& violation,
                                              const FixerContext& context)
    -> std::vector<std::filesystem::path> {
    std::vector<std::filesystem::path> targets;
    for (auto* fixer : fixers) {
        try {
            for (const auto& target : fixer->target_files(violation, context)) {
                targets.push_back(target.lexically_normal());
            }
        } catch (const std::exception& e) {
            // Unknown targets conflict with nothing; the fix itself will report the failure
            context.log.warn(fixer->name() + " could not list target files: " + e.what());
        }
    }
    return targets;
}

// Greedy wave: items in order whose targets are disjoint from everything already
// in the wave and from every earlier item that is still waiting
auto RemediationOrchestrator::next_wave(const std::vector<WorkItem>& items, std::vector<bool>& scheduled) const
    -> std::vector<size_t> {
    std::vector<size_t> wave;
    std::vector<std::filesystem::path> claimed;
    std::vector<std::filesystem::path> deferred;

    for (size_t i = 0; i < items.size(); ++i) {
        if (scheduled[i]) {
            continue;
        }
        const auto& targets = items[i].targets;
        if (overlaps(targets, claimed) || overlaps(targets, deferred)) {
            deferred.insert(deferred.end(), targets.begin(), targets.end());
            continue;
        }
        claimed.insert(claimed.end(), targets.begin(), targets.end());
        wave.push_back(i);
        scheduled[i] = true;
    }
    return wave;
}

auto RemediationOrchestrator::log_summary(const std::vector<FixResult>& results,
                                          const FixerContext& context) const -> void {
    auto summary = summarize(results);
    context.log.info("Remediation complete: " + std::to_string(summary.fixed) + " fixed, "
                     + std::to_string(summary.dry_run) + " planned, " + std::to_string(summary.skipped)
                     + " skipped, " + std::to_string(summary.failed) + " failed");
}

} // namespace stratify

#include "stratify/fix/fixer_registry.hpp"
#include <algorithm>

namespace stratify {

auto FixerRegistry::register_fixer(std::unique_ptr<IFixer> fixer) -> void {
    auto* raw = fixer.get();
    fixers_.push_back(std::move(fixer));

    for (const auto& rule : raw->supported_rules()) {
        auto& candidates = by_rule_[rule];
        candidates.push_back(raw);
        std::stable_sort(candidates.begin(), candidates.end(),
                         [](const IFixer* a, const IFixer* b) { return a->priority() > b->priority(); });
    }
}

auto FixerRegistry::fixers_for_rule(std::string_view rule_id) const -> std::vector<IFixer*> {
    if (auto it = by_rule_.find(rule_id); it != by_rule_.end()) {
        return it->second;
    }
    return {};
}

auto FixerRegistry::fixers_for(const StructureViolation& violation) const -> std::vector<IFixer*> {
    std::vector<IFixer*> candidates;
    for (auto* fixer : fixers_for_rule(violation.rule_id)) {
        if (fixer->can_fix(violation)) {
            candidates.push_back(fixer);
        }
    }
    return candidates;
}

auto FixerRegistry::find_fixer(const StructureViolation& violation) const -> IFixer* {
    auto candidates = fixers_for(violation);
    return candidates.empty() ? nullptr : candidates.front();
}

auto FixerRegistry::all() const -> std::vector<IFixer*> {
    std::vector<IFixer*> result;
    for (const auto& fixer : fixers_) {
        result.push_back(fixer.get());
    }
    std::stable_sort(result.begin(), result.end(),
                     [](const IFixer* a, const IFixer* b) { return a->priority() > b->priority(); });
    return result;
}

} // namespace stratify

#pragma once

#include "stratify/fix/fixer.hpp"
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace stratify {

// Owns fixers and dispatches by rule id, highest priority first.
// Equal priorities keep registration order.
class FixerRegistry {
public:
    auto register_fixer(std::unique_ptr<IFixer> fixer) -> void;

    auto fixers_for_rule(std::string_view rule_id) const -> std::vector<IFixer*>;

    // Candidates for rule id whose can_fix() accepts the violation
    auto fixers_for(const StructureViolation& violation) const -> std::vector<IFixer*>;

    // Highest-priority candidate, nullptr if none
    auto find_fixer(const StructureViolation& violation) const -> IFixer*;

    auto all() const -> std::vector<IFixer*>;
    auto size() const -> size_t { return fixers_.size(); }

private:
    std::vector<std::unique_ptr<IFixer>> fixers_;
    std::map<std::string, std::vector<IFixer*>, std::less<>> by_rule_;
};

} // namespace stratify

#include "stratify/core/violation.hpp"

namespace stratify {

auto severity_name(Severity severity) -> std::string {
    switch (severity) {
    case Severity::ERROR:
        return "ERROR";
    case Severity::WARNING:
        return "WARNING";
    case Severity::INFO:
        return "INFO";
    }
    return "WARNING";
}

auto category_for_rule(std::string_view rule_id) -> std::string {
    auto prefix = rule_id.substr(0, rule_id.find('-'));
    if (prefix == "MS") {
        return "ModuleStructure";
    }
    if (prefix == "FX") {
        return "FixerDesign";
    }
    if (prefix == "FA") {
        return "Facade";
    }
    if (prefix == "AG") {
        return "Aggregator";
    }
    return "General";
}

auto violation_key(const StructureViolation& violation) -> std::string {
    return violation.rule_id + ":" + violation.location.generic_string() + ":" + violation.found;
}

} // namespace stratify

#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace stratify {

enum class Severity {
    ERROR,
    WARNING,
    INFO
};

// A single breach of a layering rule. Immutable once produced by a detector.
struct StructureViolation {
    std::string rule_id;
    std::string rule_category;
    std::string message;
    std::filesystem::path location;
    std::string found;
    std::string expected;
    std::string suggested_fix;
    std::string reference;
    Severity severity = Severity::WARNING;

    auto operator==(const StructureViolation& other) const -> bool = default;
};

auto severity_name(Severity severity) -> std::string;

// Category for a rule id prefix ("MS-001" -> "ModuleStructure")
auto category_for_rule(std::string_view rule_id) -> std::string;

// Stable key used to order and deduplicate violations
auto violation_key(const StructureViolation& violation) -> std::string;

} // namespace stratify

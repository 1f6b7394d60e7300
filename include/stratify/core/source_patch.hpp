#pragma once

#include "stratify/core/fix_result.hpp"
#include "stratify/core/type_mapping.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace stratify::source_patch {

struct PatchOutcome {
    std::string content;
    std::vector<DiffPair> diffs;
    size_t replacements{};
};

// Rewrites "public [static] <core_type> name(...) {" signatures to the API type.
// Content outside the matched signatures is preserved byte for byte.
auto rewrite_return_types(const std::string& content, std::string_view core_type,
                          const TypeMapping& mapping) -> PatchOutcome;

// Adds the API import when needed and drops the core import once nothing else uses it.
// Appends one DiffPair per import line touched.
auto reconcile_imports(const std::string& content, std::string_view core_type,
                       const TypeMapping& mapping, std::vector<DiffPair>& diffs) -> std::string;

auto package_name_of(std::string_view content) -> std::string;

// Fully qualified name of an import that ends in ".<type_name>", if present
auto find_import(std::string_view content, std::string_view type_name) -> std::optional<std::string>;

// Core type named in a detector message: "returns DefaultX", "return type FooImpl"
auto extract_core_type(std::string_view message, const TypeMappingTable& table)
    -> std::optional<std::string>;

} // namespace stratify::source_patch

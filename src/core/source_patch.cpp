#include "stratify/core/source_patch.hpp"
#include "stratify/core/functional_core.hpp"
#include <algorithm>
#include <regex>

namespace stratify::source_patch {

namespace {

// public [static|final|synchronized]... Type name(params) [throws A, B] {
const std::regex METHOD_PATTERN{
    R"((public\s+(?:(?:static|final|synchronized)\s+)*)(\w+)(\s+\w+\s*\([^)]*\)\s*(?:throws\s+[\w.]+(?:\s*,\s*[\w.]+)*\s*)?\{))"};
const std::regex CORE_TYPE_PATTERN{R"((?:returns?|return type)\s+(Default\w+|\w+Impl))",
                                   std::regex::icase};
const std::regex PACKAGE_PATTERN{R"(^\s*package\s+([\w.]+)\s*;)"};
const std::regex IMPORT_PATTERN{R"(^\s*import\s+(static\s+)?([\w.]+(?:\.\*)?)\s*;)"};

struct ImportLine {
    size_t index{};
    std::string qualified_name;
};

auto collect_imports(const std::vector<std::string>& lines) -> std::vector<ImportLine> {
    std::vector<ImportLine> imports;
    for (size_t i = 0; i < lines.size(); ++i) {
        std::smatch match;
        if (std::regex_search(lines[i], match, IMPORT_PATTERN) && !match[1].matched) {
            imports.push_back({.index = i, .qualified_name = match[2].str()});
        }
    }
    return imports;
}

auto find_package_line(const std::vector<std::string>& lines) -> std::optional<size_t> {
    for (size_t i = 0; i < lines.size(); ++i) {
        if (std::regex_search(lines[i], PACKAGE_PATTERN)) {
            return i;
        }
    }
    return std::nullopt;
}

auto import_statement(std::string_view qualified_name) -> std::string {
    return "import " + std::string(qualified_name) + ";";
}

} // namespace

auto rewrite_return_types(const std::string& content, std::string_view core_type,
                          const TypeMapping& mapping) -> PatchOutcome {
    PatchOutcome outcome;
    auto api_type = mapping.api_simple_name();
    size_t last = 0;

    for (auto it = std::sregex_iterator(content.begin(), content.end(), METHOD_PATTERN);
         it != std::sregex_iterator(); ++it) {
        const auto& match = *it;
        if (match[2].str() != core_type) {
            continue;
        }

        auto start = static_cast<size_t>(match.position(0));
        auto replacement = match[1].str() + api_type + match[3].str();
        outcome.content.append(content, last, start - last);
        outcome.content += replacement;
        outcome.diffs.push_back({.removed = functional_core::trim(match[0].str()),
                                 .added = functional_core::trim(replacement)});
        last = start + static_cast<size_t>(match.length(0));
        ++outcome.replacements;
    }

    if (outcome.replacements == 0) {
        outcome.content = content;
        return outcome;
    }
    outcome.content.append(content, last, std::string::npos);
    return outcome;
}

auto package_name_of(std::string_view content) -> std::string {
    std::string text{content};
    std::smatch match;
    for (const auto& line : functional_core::split_lines(text)) {
        if (std::regex_search(line, match, PACKAGE_PATTERN)) {
            return match[1].str();
        }
    }
    return "";
}

auto find_import(std::string_view content, std::string_view type_name) -> std::optional<std::string> {
    auto suffix = "." + std::string(type_name);
    for (const auto& import : collect_imports(functional_core::split_lines(content))) {
        if (import.qualified_name.ends_with(suffix)) {
            return import.qualified_name;
        }
    }
    return std::nullopt;
}

auto reconcile_imports(const std::string& content, std::string_view core_type,
                       const TypeMapping& mapping, std::vector<DiffPair>& diffs) -> std::string {
    auto lines = functional_core::split_lines(content);
    auto imports = collect_imports(lines);
    auto file_package = package_name_of(content);

    // Add the API import
    const auto& api_fqn = mapping.api_fqn;
    auto api_package = package_of(api_fqn);
    bool api_imported = std::any_of(imports.begin(), imports.end(), [&](const ImportLine& line) {
        return line.qualified_name == api_fqn || line.qualified_name == api_package + ".*";
    });

    if (!api_package.empty() && api_package != file_package && !api_imported) {
        std::optional<size_t> anchor;
        if (!imports.empty()) {
            anchor = imports.back().index;
        } else {
            anchor = find_package_line(lines);
        }

        auto statement = import_statement(api_fqn);
        if (anchor) {
            auto& anchor_line = lines[*anchor];
            auto ending = std::string(functional_core::line_ending_of(anchor_line));
            if (ending.empty()) {
                ending = "\n";
                anchor_line += ending;
            }
            lines.insert(lines.begin() + static_cast<std::ptrdiff_t>(*anchor) + 1, statement + ending);
        } else {
            lines.insert(lines.begin(), statement + "\n");
        }
        diffs.push_back({.removed = "", .added = statement});
    }

    // Drop the core import once the type no longer appears anywhere else
    auto core_fqn = mapping.core_fqn;
    if (mapping.inferred || core_fqn.find('.') == std::string::npos) {
        auto imported = find_import(functional_core::join_lines(lines), core_type);
        core_fqn = imported.value_or("");
    }

    if (!core_fqn.empty()) {
        for (const auto& import : collect_imports(lines)) {
            if (import.qualified_name != core_fqn) {
                continue;
            }
            std::vector<std::string> remaining = lines;
            remaining.erase(remaining.begin() + static_cast<std::ptrdiff_t>(import.index));
            if (!functional_core::contains_word(functional_core::join_lines(remaining), core_type)) {
                lines = std::move(remaining);
                diffs.push_back({.removed = import_statement(core_fqn), .added = ""});
            }
            break;
        }
    }

    return functional_core::join_lines(lines);
}

auto extract_core_type(std::string_view message, const TypeMappingTable& table)
    -> std::optional<std::string> {
    std::string text{message};
    std::smatch match;
    if (std::regex_search(text, match, CORE_TYPE_PATTERN)) {
        return match[1].str();
    }

    for (const auto& [core_name, mapping] : table) {
        if (functional_core::contains_word(message, core_name)) {
            return core_name;
        }
    }
    return std::nullopt;
}

} // namespace stratify::source_patch

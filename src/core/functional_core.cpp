#include "stratify/core/functional_core.hpp"
#include <algorithm>
#include <cctype>

namespace stratify::functional_core {

namespace {

auto is_identifier_char(char c) -> bool {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

// Position of <tag>value</tag> starting at or after offset, or npos
auto find_element(std::string_view xml, std::string_view tag, size_t offset, std::string& value)
    -> size_t {
    std::string open = "<" + std::string(tag) + ">";
    std::string close = "</" + std::string(tag) + ">";

    auto start = xml.find(open, offset);
    if (start == std::string_view::npos) {
        return std::string_view::npos;
    }
    auto value_start = start + open.size();
    auto end = xml.find(close, value_start);
    if (end == std::string_view::npos) {
        return std::string_view::npos;
    }
    value = trim(xml.substr(value_start, end - value_start));
    return start;
}

} // namespace

auto to_lowercase(std::string_view text) -> std::string {
    std::string result{text};
    std::transform(result.begin(), result.end(), result.begin(), ::tolower);
    return result;
}

auto trim(std::string_view text) -> std::string {
    auto start = text.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) {
        return "";
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return std::string(text.substr(start, end - start + 1));
}

auto split_lines(std::string_view text) -> std::vector<std::string> {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < text.size()) {
        auto newline = text.find('\n', start);
        if (newline == std::string_view::npos) {
            lines.emplace_back(text.substr(start));
            break;
        }
        lines.emplace_back(text.substr(start, newline - start + 1));
        start = newline + 1;
    }
    return lines;
}

auto join_lines(std::span<const std::string> lines) -> std::string {
    std::string result;
    for (const auto& line : lines) {
        result += line;
    }
    return result;
}

auto line_ending_of(std::string_view line) -> std::string_view {
    if (line.ends_with("\r\n")) {
        return "\r\n";
    }
    if (line.ends_with('\n')) {
        return "\n";
    }
    return "";
}

auto contains_word(std::string_view text, std::string_view word) -> bool {
    if (word.empty()) {
        return false;
    }
    size_t pos = text.find(word);
    while (pos != std::string_view::npos) {
        bool left_ok = pos == 0 || !is_identifier_char(text[pos - 1]);
        auto after = pos + word.size();
        bool right_ok = after >= text.size() || !is_identifier_char(text[after]);
        if (left_ok && right_ok) {
            return true;
        }
        pos = text.find(word, pos + 1);
    }
    return false;
}

auto to_pascal_case(std::string_view name) -> std::string {
    std::string result;
    bool capitalize = true;
    for (char c : name) {
        if (c == '-' || c == '_' || c == '.' || c == ' ') {
            capitalize = true;
            continue;
        }
        if (capitalize) {
            result += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            capitalize = false;
        } else {
            result += c;
        }
    }
    return result;
}

auto extract_xml_value(std::string_view xml, std::string_view tag, std::string_view fallback)
    -> std::string {
    std::string value;

    auto parent_end = xml.find("</parent>");
    if (parent_end != std::string_view::npos
        && find_element(xml, tag, parent_end, value) != std::string_view::npos) {
        return value;
    }

    if (find_element(xml, tag, 0, value) != std::string_view::npos) {
        return value;
    }
    return std::string(fallback);
}

auto directory_name(const std::filesystem::path& path) -> std::string {
    auto normal = path.lexically_normal();
    if (!normal.has_filename()) {
        normal = normal.parent_path();
    }
    return normal.filename().string();
}

auto module_base_name(const std::filesystem::path& module_path) -> std::string {
    auto name = directory_name(module_path);
    for (std::string_view suffix : {std::string_view{"-parent"}, std::string_view{"-aggregator"}}) {
        if (name.size() > suffix.size() && name.ends_with(suffix)) {
            return name.substr(0, name.size() - suffix.size());
        }
    }
    return name;
}

auto to_package_segment(std::string_view name) -> std::string {
    auto result = to_lowercase(name);
    std::replace(result.begin(), result.end(), '-', '.');
    return result;
}

auto package_to_path(std::string_view package_name) -> std::filesystem::path {
    std::filesystem::path result;
    size_t start = 0;
    while (start <= package_name.size()) {
        auto dot = package_name.find('.', start);
        auto segment = package_name.substr(start, dot == std::string_view::npos ? dot : dot - start);
        if (!segment.empty()) {
            result /= std::string(segment);
        }
        if (dot == std::string_view::npos) {
            break;
        }
        start = dot + 1;
    }
    return result;
}

} // namespace stratify::functional_core

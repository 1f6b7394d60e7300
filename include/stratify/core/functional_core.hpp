#pragma once

#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace stratify::functional_core {

auto to_lowercase(std::string_view text) -> std::string;
auto trim(std::string_view text) -> std::string;

// Splits into lines, each keeping its own terminator ("\n" or "\r\n").
// Concatenating the result reproduces the input byte for byte.
auto split_lines(std::string_view text) -> std::vector<std::string>;
auto join_lines(std::span<const std::string> lines) -> std::string;

// Line terminator of a line produced by split_lines ("" for an unterminated last line)
auto line_ending_of(std::string_view line) -> std::string_view;

// True if word occurs in text delimited by non-identifier characters
auto contains_word(std::string_view text, std::string_view word) -> bool;

// "agent-core" -> "AgentCore"
auto to_pascal_case(std::string_view name) -> std::string;

// Value of <tag> in a build descriptor, preferring the project's own value
// over the one inside its <parent> block
auto extract_xml_value(std::string_view xml, std::string_view tag, std::string_view fallback)
    -> std::string;

// Directory name of a module path, tolerating trailing separators
auto directory_name(const std::filesystem::path& path) -> std::string;

// Module base name: directory name without a trailing "-parent" or "-aggregator"
auto module_base_name(const std::filesystem::path& module_path) -> std::string;

// "My-Project" -> "my.project" (usable as a package segment)
auto to_package_segment(std::string_view name) -> std::string;

// "a.b.c" -> "a/b/c"
auto package_to_path(std::string_view package_name) -> std::filesystem::path;

} // namespace stratify::functional_core

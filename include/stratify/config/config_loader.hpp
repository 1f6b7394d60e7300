#pragma once

#include "stratify/core/type_mapping.hpp"
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace stratify {

inline constexpr std::string_view DEFAULT_NAMESPACE = "dev.engineeringlab";
inline constexpr std::string_view DEFAULT_PROJECT = "architecture";

struct ProjectConfig {
    std::string base_namespace{DEFAULT_NAMESPACE};
    std::string project_name{DEFAULT_PROJECT};
    std::string backup_strategy = "staging";
    bool fallthrough_on_skip = false;
    size_t max_failures = 0;
    size_t jobs = 1;
    std::set<std::string, std::less<>> disabled_rules;
    std::set<std::string, std::less<>> disabled_fixers;
    TypeMappingTable type_mappings = default_type_mappings();
    std::optional<std::filesystem::path> source;  // File the values came from, if any
};

// Reads project configuration from YAML. Malformed files raise ConfigError.
class ConfigLoader {
public:
    // Candidate file names, searched in the project root and then in src/main/resources
    static auto candidate_names() -> std::vector<std::string>;

    // nullopt when the document does not declare a namespace
    static auto parse(const std::string& yaml_text) -> std::optional<ProjectConfig>;

    static auto load_file(const std::filesystem::path& file) -> ProjectConfig;

    // First candidate that declares a namespace, defaults when none does
    static auto load_project(const std::filesystem::path& project_root) -> ProjectConfig;
};

} // namespace stratify

#include "stratify/config/config_loader.hpp"
#include "stratify/errors.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>
#include <yaml-cpp/yaml.h>

namespace stratify {

namespace {

auto read_text(const std::filesystem::path& file) -> std::string {
    std::ifstream in(file, std::ios::binary);
    if (!in.is_open()) {
        throw ConfigError("Cannot read configuration file: " + file.string());
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

auto read_string_set(const YAML::Node& node, std::string_view key) -> std::set<std::string, std::less<>> {
    std::set<std::string, std::less<>> values;
    if (!node) {
        return values;
    }
    if (!node.IsSequence()) {
        throw ConfigError("'" + std::string(key) + "' must be a list");
    }
    for (const auto& item : node) {
        values.insert(item.as<std::string>());
    }
    return values;
}

auto apply_remediation(const YAML::Node& node, ProjectConfig& config) -> void {
    if (!node) {
        return;
    }
    if (!node.IsMap()) {
        throw ConfigError("'remediation' must be a mapping");
    }
    if (const auto value = node["backup-strategy"]) {
        config.backup_strategy = value.as<std::string>();
    }
    if (const auto value = node["fallthrough-on-skip"]) {
        config.fallthrough_on_skip = value.as<bool>();
    }
    if (const auto value = node["max-failures"]) {
        config.max_failures = value.as<size_t>();
    }
    if (const auto value = node["jobs"]) {
        config.jobs = std::max<size_t>(1, value.as<size_t>());
    }
    config.disabled_rules = read_string_set(node["disabled-rules"], "disabled-rules");
    config.disabled_fixers = read_string_set(node["disabled-fixers"], "disabled-fixers");
}

auto apply_type_mappings(const YAML::Node& node, ProjectConfig& config) -> void {
    if (!node) {
        return;
    }
    if (!node.IsMap()) {
        throw ConfigError("'type-mappings' must be a mapping");
    }
    for (const auto& entry : node) {
        auto core_name = entry.first.as<std::string>();
        const auto& mapping = entry.second;
        if (!mapping.IsMap() || !mapping["api"]) {
            throw ConfigError("Type mapping '" + core_name + "' needs an 'api' entry");
        }
        auto core_fqn = mapping["core"] ? mapping["core"].as<std::string>() : core_name;
        config.type_mappings.insert_or_assign(
            simple_name(core_fqn), TypeMapping{.core_fqn = core_fqn, .api_fqn = mapping["api"].as<std::string>()});
    }
}

} // namespace

auto ConfigLoader::candidate_names() -> std::vector<std::string> {
    return {"stratify.yaml",   "stratify.yml",           ".stratify/config.yaml",  "application.yaml",
            "application.yml", "compliance-config.yaml", "compliance-config.yml"};
}

auto ConfigLoader::parse(const std::string& yaml_text) -> std::optional<ProjectConfig> {
    try {
        const YAML::Node root = YAML::Load(yaml_text);
        if (!root.IsMap() || !root["namespace"]) {
            return std::nullopt;
        }

        ProjectConfig config;
        config.base_namespace = root["namespace"].as<std::string>();
        if (const auto project = root["project"]) {
            config.project_name = project.as<std::string>();
        }
        apply_remediation(root["remediation"], config);
        apply_type_mappings(root["type-mappings"], config);
        return config;
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Invalid configuration: ") + e.what());
    }
}

auto ConfigLoader::load_file(const std::filesystem::path& file) -> ProjectConfig {
    auto config = parse(read_text(file));
    if (!config) {
        throw ConfigError("Configuration file does not declare a namespace: " + file.string());
    }
    config->source = file;
    return *config;
}

auto ConfigLoader::load_project(const std::filesystem::path& project_root) -> ProjectConfig {
    for (const auto& directory : {project_root, project_root / "src" / "main" / "resources"}) {
        for (const auto& name : candidate_names()) {
            auto file = directory / name;
            std::error_code ec;
            if (!std::filesystem::is_regular_file(file, ec)) {
                continue;
            }
            auto config = parse(read_text(file));
            if (config) {
                config->source = file;
                return *config;
            }
        }
    }
    return ProjectConfig{};
}

} // namespace stratify

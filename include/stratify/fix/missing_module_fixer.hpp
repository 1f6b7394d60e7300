#pragma once

#include "stratify/fix/fixer.hpp"
#include <string>
#include <string_view>

namespace stratify {

// Values read from the parent build descriptor
struct ParentCoordinates {
    std::string group_id = "dev.engineeringlab";
    std::string artifact_id;
    std::string version = "0.2.0-SNAPSHOT";
};

// What generating one layer submodule amounts to
struct ScaffoldPlan {
    std::string module_name;
    std::string role;
    std::filesystem::path module_directory;
    std::filesystem::path descriptor;
    std::string descriptor_content;
    std::string package_name;
    std::filesystem::path marker;
    std::string marker_content;
    std::filesystem::path parent_descriptor;
};

// MS-001 / MS-002: generates the missing "<base>-api" or "<base>-core" submodule
// of an aggregator and registers it with the parent.
class MissingModuleFixer : public IFixer {
public:
    static constexpr int PRIORITY = 90;

    auto name() const -> std::string override;
    auto description() const -> std::string override;
    auto priority() const -> int override;
    auto supported_rules() const -> std::vector<std::string> override;
    auto target_files(const StructureViolation& violation, const FixerContext& context)
        -> std::vector<std::filesystem::path> override;
    auto fix(const StructureViolation& violation, const FixerContext& context) -> FixResult override;

    static auto plan(const std::filesystem::path& module_root, std::string_view role,
                     const ParentCoordinates& parent, const FixerContext& context) -> ScaffoldPlan;
};

namespace scaffold {

auto role_for_rule(std::string_view rule_id) -> std::string;
auto layer_description(std::string_view role) -> std::string;

auto generate_descriptor(const ParentCoordinates& parent, std::string_view module_name,
                         std::string_view base_name, std::string_view role) -> std::string;
auto generate_package_marker(std::string_view package_name, std::string_view base_name,
                             std::string_view role) -> std::string;

// Appends <module>name</module> to the descriptor's module list, creating the list if needed.
// Returns the input unchanged when the module is already listed.
auto add_module_to_parent(const std::string& descriptor, std::string_view module_name) -> std::string;

} // namespace scaffold

} // namespace stratify

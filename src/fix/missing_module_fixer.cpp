#include "stratify/fix/missing_module_fixer.hpp"
#include "stratify/backup/backup_transaction.hpp"
#include "stratify/core/functional_core.hpp"
#include "stratify/scan/module_scanner.hpp"
#include "stratify/scan/module_source_index.hpp"
#include <cctype>
#include <sstream>

namespace stratify {

namespace scaffold {

auto role_for_rule(std::string_view rule_id) -> std::string {
    return rule_id == "MS-001" ? "api" : "core";
}

auto layer_description(std::string_view role) -> std::string {
    if (role == "api") {
        return "API layer - public interfaces and contracts";
    }
    if (role == "core") {
        return "Core layer - implementations";
    }
    if (role == "spi") {
        return "SPI layer - service provider interfaces";
    }
    if (role == "facade") {
        return "Facade layer - unified entry points";
    }
    std::string upper{role};
    for (auto& c : upper) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return upper + " layer";
}

auto generate_descriptor(const ParentCoordinates& parent, std::string_view module_name,
                         std::string_view base_name, std::string_view role) -> std::string {
    bool api = role == "api";
    auto base = std::string(base_name);
    auto display_name = functional_core::to_pascal_case(base_name) + (api ? " API" : " Core");
    auto summary = api ? "API module for " + base + " - contains public interfaces and contracts"
                       : "Core module for " + base + " - contains implementations";

    std::ostringstream pom;
    pom << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
        << "<project xmlns=\"http://maven.apache.org/POM/4.0.0\"\n"
        << "         xmlns:xsi=\"http://www.w3.org/2001/XMLSchema-instance\"\n"
        << "         xsi:schemaLocation=\"http://maven.apache.org/POM/4.0.0 "
        << "http://maven.apache.org/xsd/maven-4.0.0.xsd\">\n"
        << "    <modelVersion>4.0.0</modelVersion>\n\n"
        << "    <parent>\n"
        << "        <groupId>" << parent.group_id << "</groupId>\n"
        << "        <artifactId>" << parent.artifact_id << "</artifactId>\n"
        << "        <version>" << parent.version << "</version>\n"
        << "    </parent>\n\n"
        << "    <artifactId>" << module_name << "</artifactId>\n"
        << "    <packaging>jar</packaging>\n\n"
        << "    <name>" << display_name << "</name>\n"
        << "    <description>" << summary << "</description>\n\n"
        << "    <dependencies>\n";
    if (role == "core") {
        pom << "        <dependency>\n"
            << "            <groupId>" << parent.group_id << "</groupId>\n"
            << "            <artifactId>" << base << "-api</artifactId>\n"
            << "            <version>${project.version}</version>\n"
            << "        </dependency>\n";
    }
    pom << "    </dependencies>\n\n"
        << "</project>\n";
    return pom.str();
}

auto generate_package_marker(std::string_view package_name, std::string_view base_name,
                             std::string_view role) -> std::string {
    std::ostringstream marker;
    marker << "/**\n"
           << " * " << layer_description(role) << " for " << base_name << ".\n"
           << " */\n"
           << "package " << package_name << ";\n";
    return marker.str();
}

auto add_module_to_parent(const std::string& descriptor, std::string_view module_name) -> std::string {
    auto entry = "<module>" + std::string(module_name) + "</module>";
    if (descriptor.find(entry) != std::string::npos) {
        return descriptor;
    }

    auto result = descriptor;
    if (auto close = result.find("</modules>"); close != std::string::npos) {
        result.insert(close, "    " + entry + "\n    ");
        return result;
    }

    if (auto close = result.rfind("</project>"); close != std::string::npos) {
        result.insert(close, "    <modules>\n        " + entry + "\n    </modules>\n\n");
        return result;
    }
    return result + "<modules>\n    " + entry + "\n</modules>\n";
}

} // namespace scaffold

auto MissingModuleFixer::name() const -> std::string {
    return "MissingModuleFixer";
}

auto MissingModuleFixer::description() const -> std::string {
    return "Generates missing API and Core submodules for aggregator modules";
}

auto MissingModuleFixer::priority() const -> int {
    return PRIORITY;
}

auto MissingModuleFixer::supported_rules() const -> std::vector<std::string> {
    return {"MS-001", "MS-002"};
}

auto MissingModuleFixer::plan(const std::filesystem::path& module_root, std::string_view role,
                              const ParentCoordinates& parent, const FixerContext& context)
    -> ScaffoldPlan {
    auto base_name = functional_core::module_base_name(module_root);
    auto module_name = base_name + "-" + std::string(role);
    auto module_directory = module_root / module_name;
    auto package_name = context.base_namespace + "." + functional_core::to_package_segment(context.project_name)
                        + "." + std::string(role);

    return ScaffoldPlan{
        .module_name = module_name,
        .role = std::string(role),
        .module_directory = module_directory,
        .descriptor = module_directory / BUILD_DESCRIPTOR,
        .descriptor_content = scaffold::generate_descriptor(parent, module_name, base_name, role),
        .package_name = package_name,
        .marker = module_directory / SOURCE_DIRECTORY / functional_core::package_to_path(package_name)
                  / PACKAGE_MARKER,
        .marker_content = scaffold::generate_package_marker(package_name, base_name, role),
        .parent_descriptor = module_root / BUILD_DESCRIPTOR,
    };
}

auto MissingModuleFixer::target_files(const StructureViolation& violation, const FixerContext& context)
    -> std::vector<std::filesystem::path> {
    auto module_root = derive_module_root(violation, context);
    auto planned = plan(module_root, scaffold::role_for_rule(violation.rule_id),
                        ParentCoordinates{.artifact_id = functional_core::directory_name(module_root)},
                        context);
    return {planned.descriptor, planned.marker, planned.parent_descriptor};
}

auto MissingModuleFixer::fix(const StructureViolation& violation, const FixerContext& context) -> FixResult {
    if (!can_fix(violation)) {
        return fix_skipped(violation, "Not a missing API/Core module violation");
    }

    auto& filesystem = context.filesystem;
    auto module_root = derive_module_root(violation, context);
    auto parent_descriptor = module_root / BUILD_DESCRIPTOR;
    if (!filesystem.is_regular_file(parent_descriptor)) {
        return fix_skipped(violation, "No " + std::string(BUILD_DESCRIPTOR) + " found in module root");
    }

    auto parent_content = filesystem.read_file(parent_descriptor);
    auto packaging = functional_core::extract_xml_value(parent_content, "packaging", "jar");
    if (packaging != AGGREGATOR_PACKAGING) {
        return fix_skipped(violation, "Module is not a parent (packaging=" + packaging
                                          + "). Only parent modules with packaging=pom can have submodules.");
    }

    auto role = scaffold::role_for_rule(violation.rule_id);
    auto base_name = functional_core::module_base_name(module_root);
    if (filesystem.exists(module_root / (base_name + "-" + role))) {
        return fix_skipped(violation, "Module directory already exists: " + base_name + "-" + role);
    }

    ParentCoordinates parent;
    parent.group_id = functional_core::extract_xml_value(parent_content, "groupId", parent.group_id);
    parent.version = functional_core::extract_xml_value(parent_content, "version", parent.version);
    parent.artifact_id = functional_core::extract_xml_value(parent_content, "artifactId", base_name);

    auto scaffold_plan = plan(module_root, role, parent, context);
    auto updated_parent = scaffold::add_module_to_parent(parent_content, scaffold_plan.module_name);
    bool parent_changes = updated_parent != parent_content;

    auto relative_marker = scaffold_plan.marker.lexically_relative(module_root).generic_string();
    std::vector<DiffPair> diffs{
        {.removed = "", .added = "create directory: " + scaffold_plan.module_name},
        {.removed = "", .added = "create: " + scaffold_plan.module_name + "/" + std::string(BUILD_DESCRIPTOR)},
        {.removed = "", .added = "create: " + relative_marker},
    };
    if (parent_changes) {
        diffs.push_back({.removed = "",
                         .added = "add module " + scaffold_plan.module_name + " to "
                                  + std::string(BUILD_DESCRIPTOR)});
    }

    std::vector<std::filesystem::path> files{scaffold_plan.descriptor, scaffold_plan.marker};
    if (parent_changes) {
        files.push_back(parent_descriptor);
    }

    auto summary = std::string(role == "api" ? "Create API module: " : "Create Core module: ")
                   + scaffold_plan.module_name;

    if (context.dry_run) {
        return fix_applied(violation, true, summary, files, std::move(diffs));
    }

    auto write_all = [&] {
        filesystem.create_directories(scaffold_plan.marker.parent_path());
        filesystem.write_file(scaffold_plan.descriptor, scaffold_plan.descriptor_content);
        filesystem.write_file(scaffold_plan.marker, scaffold_plan.marker_content);
        if (parent_changes) {
            filesystem.write_file(parent_descriptor, updated_parent);
        }
    };

    if (context.backup) {
        BackupTransaction transaction(*context.backup, files, context.project_root);
        write_all();
        transaction.commit();
    } else {
        write_all();
    }

    context.log.info("Created " + scaffold_plan.module_name + " in " + module_root.string());
    return fix_applied(violation, false, summary, files, std::move(diffs));
}

} // namespace stratify

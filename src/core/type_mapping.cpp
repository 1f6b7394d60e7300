#include "stratify/core/type_mapping.hpp"
#include <cctype>

namespace stratify {

namespace {

constexpr std::string_view DEFAULT_PREFIX = "Default";
constexpr std::string_view IMPL_SUFFIX = "Impl";

auto make_mapping(std::string core_fqn, std::string api_fqn) -> TypeMapping {
    return TypeMapping{.core_fqn = std::move(core_fqn), .api_fqn = std::move(api_fqn)};
}

} // namespace

auto TypeMapping::core_simple_name() const -> std::string {
    return simple_name(core_fqn);
}

auto TypeMapping::api_simple_name() const -> std::string {
    return simple_name(api_fqn);
}

auto simple_name(std::string_view qualified_name) -> std::string {
    auto dot = qualified_name.rfind('.');
    if (dot == std::string_view::npos) {
        return std::string(qualified_name);
    }
    return std::string(qualified_name.substr(dot + 1));
}

auto package_of(std::string_view qualified_name) -> std::string {
    auto dot = qualified_name.rfind('.');
    if (dot == std::string_view::npos) {
        return "";
    }
    return std::string(qualified_name.substr(0, dot));
}

auto default_type_mappings() -> TypeMappingTable {
    TypeMappingTable table;
    table.emplace("DefaultAgentRegistry",
                  make_mapping("dev.engineeringlab.agent.core.DefaultAgentRegistry",
                               "dev.engineeringlab.agent.registry.AgentRegistry"));
    table.emplace("DefaultAgentManager",
                  make_mapping("dev.engineeringlab.agent.core.DefaultAgentManager",
                               "dev.engineeringlab.agent.orchestration.AgentManager"));
    table.emplace("DefaultCommunicationManager",
                  make_mapping("dev.engineeringlab.agent.coordination.DefaultCommunicationManager",
                               "dev.engineeringlab.agent.communication.CommunicationManager"));
    return table;
}

auto is_core_type_name(std::string_view type_name) -> bool {
    if (type_name.size() > DEFAULT_PREFIX.size() && type_name.starts_with(DEFAULT_PREFIX)
        && std::isupper(static_cast<unsigned char>(type_name[DEFAULT_PREFIX.size()]))) {
        return true;
    }
    return type_name.size() > IMPL_SUFFIX.size() && type_name.ends_with(IMPL_SUFFIX)
           && std::isupper(static_cast<unsigned char>(type_name.front()));
}

auto infer_mapping(std::string_view core_type) -> std::optional<TypeMapping> {
    if (!is_core_type_name(core_type)) {
        return std::nullopt;
    }

    std::string api_name;
    if (core_type.starts_with(DEFAULT_PREFIX)
        && std::isupper(static_cast<unsigned char>(core_type[DEFAULT_PREFIX.size()]))) {
        api_name = std::string(core_type.substr(DEFAULT_PREFIX.size()));
    } else {
        api_name = std::string(core_type.substr(0, core_type.size() - IMPL_SUFFIX.size()));
    }

    return TypeMapping{
        .core_fqn = std::string(core_type),
        .api_fqn = std::move(api_name),
        .inferred = true,
    };
}

auto resolve_mapping(const TypeMappingTable& table, std::string_view core_type)
    -> std::optional<TypeMapping> {
    if (auto it = table.find(core_type); it != table.end()) {
        return it->second;
    }
    return infer_mapping(core_type);
}

} // namespace stratify

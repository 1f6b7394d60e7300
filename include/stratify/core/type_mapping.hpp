#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace stratify {

// Pairs an implementation type with the interface a facade should expose instead
struct TypeMapping {
    std::string core_fqn;
    std::string api_fqn;
    bool inferred = false;  // Derived from naming convention, packages unknown

    auto core_simple_name() const -> std::string;
    auto api_simple_name() const -> std::string;

    auto operator==(const TypeMapping& other) const -> bool = default;
};

// Keyed by core simple name
using TypeMappingTable = std::map<std::string, TypeMapping, std::less<>>;

auto simple_name(std::string_view qualified_name) -> std::string;
auto package_of(std::string_view qualified_name) -> std::string;

// Built-in mappings for the platform's well-known registries and managers
auto default_type_mappings() -> TypeMappingTable;

// "Default" prefix or "Impl" suffix around a capitalized name
auto is_core_type_name(std::string_view type_name) -> bool;

// DefaultAgentRegistry -> AgentRegistry, ServiceImpl -> Service
auto infer_mapping(std::string_view core_type) -> std::optional<TypeMapping>;

// Table lookup first, naming convention second
auto resolve_mapping(const TypeMappingTable& table, std::string_view core_type)
    -> std::optional<TypeMapping>;

} // namespace stratify

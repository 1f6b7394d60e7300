#pragma once

#include "stratify/java/tokenizer.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace stratify::java {

enum class TypeKind {
    CLASS,
    INTERFACE,
    ENUM,
    RECORD,
    ANNOTATION
};

// How a type relates to the capability a rule is interested in
enum class ClassRole {
    PLAIN,
    CAPABILITY,      // Implements the capability interface
    BASE_EXTENDER    // Extends the capability's abstract base
};

struct ReturnStatement {
    size_t line{};
    bool returns_null = false;
};

struct MethodDecl {
    std::string name;
    std::string return_type;  // Empty for constructors
    std::vector<std::string> modifiers;
    size_t parameter_count{};
    size_t line{};
    bool has_body = false;
    std::vector<ReturnStatement> returns;

    auto has_modifier(std::string_view modifier) const -> bool;
    auto first_null_return() const -> std::optional<size_t>;
};

struct TypeDecl {
    std::string name;
    TypeKind kind = TypeKind::CLASS;
    std::vector<std::string> extends;     // Simple names
    std::vector<std::string> implements;  // Simple names
    ClassRole role = ClassRole::PLAIN;
    size_t line{};
    std::vector<MethodDecl> methods;

    auto is_interface() const -> bool { return kind == TypeKind::INTERFACE || kind == TypeKind::ANNOTATION; }
    auto find_methods(std::string_view method_name, size_t arity) const -> std::vector<const MethodDecl*>;
};

// Structural view of one compilation unit. Nested types are flattened in declaration order.
struct SourceIndex {
    std::string package_name;
    std::vector<std::string> imports;
    std::vector<TypeDecl> types;
};

struct CapabilityMatcher {
    std::vector<std::string> capability_interfaces;
    std::vector<std::string> base_classes;

    auto classify(const TypeDecl& type) const -> ClassRole;
};

// Throws ParseError on unbalanced or truncated source
auto parse_source(std::string_view source, const CapabilityMatcher& matcher = {}) -> SourceIndex;

} // namespace stratify::java

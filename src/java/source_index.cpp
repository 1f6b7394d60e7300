#include "stratify/java/source_index.hpp"
#include <algorithm>
#include <array>

namespace stratify::java {

namespace {

constexpr std::array MODIFIERS = {
    std::string_view{"public"},    std::string_view{"protected"}, std::string_view{"private"},
    std::string_view{"static"},    std::string_view{"final"},     std::string_view{"abstract"},
    std::string_view{"synchronized"}, std::string_view{"native"}, std::string_view{"transient"},
    std::string_view{"volatile"},  std::string_view{"strictfp"},  std::string_view{"default"},
    std::string_view{"sealed"},
};

auto is_modifier(std::string_view word) -> bool {
    return std::find(MODIFIERS.begin(), MODIFIERS.end(), word) != MODIFIERS.end();
}

auto line_suffix(const Token* token) -> std::string {
    return token ? " at line " + std::to_string(token->line) : " at end of file";
}

class Parser {
public:
    Parser(std::vector<Token> tokens, const CapabilityMatcher& matcher)
        : tokens_(std::move(tokens)), matcher_(matcher) {}

    auto parse() -> SourceIndex {
        while (!at_end()) {
            const auto& token = tokens_[pos_];
            if (token.is_identifier("package")) {
                ++pos_;
                index_.package_name = parse_qualified_name();
                expect_symbol(';');
            } else if (token.is_identifier("import")) {
                ++pos_;
                if (is_identifier(0, "static")) {
                    ++pos_;
                }
                index_.imports.push_back(parse_qualified_name());
                expect_symbol(';');
            } else if (auto kind = type_keyword()) {
                parse_type_declaration(*kind);
            } else if (token.is_symbol('@')) {
                skip_annotation();
            } else if (token.is_symbol('{') || token.is_symbol('}')) {
                throw ParseError("Unexpected '" + token.text + "'" + line_suffix(&token));
            } else {
                ++pos_;
            }
        }
        return std::move(index_);
    }

private:
    auto at_end() const -> bool { return pos_ >= tokens_.size(); }

    auto peek(size_t ahead) const -> const Token* {
        return pos_ + ahead < tokens_.size() ? &tokens_[pos_ + ahead] : nullptr;
    }

    auto is_symbol(size_t ahead, char c) const -> bool {
        const auto* token = peek(ahead);
        return token && token->is_symbol(c);
    }

    auto is_identifier(size_t ahead, std::string_view text) const -> bool {
        const auto* token = peek(ahead);
        return token && token->is_identifier(text);
    }

    auto is_any_identifier(size_t ahead) const -> bool {
        const auto* token = peek(ahead);
        return token && token->kind == TokenKind::IDENTIFIER;
    }

    auto expect_identifier() -> const Token& {
        if (!is_any_identifier(0)) {
            throw ParseError("Expected identifier" + line_suffix(peek(0)));
        }
        return tokens_[pos_++];
    }

    auto expect_symbol(char c) -> void {
        if (!is_symbol(0, c)) {
            throw ParseError(std::string("Expected '") + c + "'" + line_suffix(peek(0)));
        }
        ++pos_;
    }

    // Detects class/interface/enum/record/@interface at the current position
    auto type_keyword() const -> std::optional<TypeKind> {
        bool after_dot = pos_ > 0 && tokens_[pos_ - 1].is_symbol('.');
        if (after_dot) {
            return std::nullopt;
        }
        if (is_identifier(0, "class")) {
            return TypeKind::CLASS;
        }
        if (is_identifier(0, "interface")) {
            return TypeKind::INTERFACE;
        }
        if (is_identifier(0, "enum") && is_any_identifier(1)) {
            return TypeKind::ENUM;
        }
        if (is_identifier(0, "record") && is_any_identifier(1) && (is_symbol(2, '(') || is_symbol(2, '<'))) {
            return TypeKind::RECORD;
        }
        if (is_symbol(0, '@') && is_identifier(1, "interface")) {
            return TypeKind::ANNOTATION;
        }
        return std::nullopt;
    }

    auto parse_qualified_name() -> std::string {
        std::string name = expect_identifier().text;
        while (is_symbol(0, '.')) {
            if (is_any_identifier(1)) {
                name += "." + tokens_[pos_ + 1].text;
                pos_ += 2;
            } else if (is_symbol(1, '*')) {
                name += ".*";
                pos_ += 2;
            } else {
                break;
            }
        }
        return name;
    }

    // Current token is the opening symbol; leaves pos_ just past its partner
    auto skip_balanced(char open, char close) -> void {
        const auto* start = peek(0);
        size_t depth = 0;
        while (!at_end()) {
            const auto& token = tokens_[pos_++];
            if (token.is_symbol(open)) {
                ++depth;
            } else if (token.is_symbol(close)) {
                if (--depth == 0) {
                    return;
                }
            }
        }
        throw ParseError(std::string("Unbalanced '") + open + "'" + line_suffix(start));
    }

    auto skip_annotation() -> void {
        ++pos_;  // '@'
        parse_qualified_name();
        if (is_symbol(0, '(')) {
            skip_balanced('(', ')');
        }
    }

    // Consumes through the terminating ';'. Stops before a '}' that closes the enclosing body.
    auto skip_to_semicolon() -> void {
        const auto* start = peek(0);
        while (!at_end()) {
            const auto& token = tokens_[pos_];
            if (token.is_symbol(';')) {
                ++pos_;
                return;
            }
            if (token.is_symbol('}')) {
                return;
            }
            if (token.is_symbol('(')) {
                skip_balanced('(', ')');
            } else if (token.is_symbol('{')) {
                skip_balanced('{', '}');
            } else if (token.is_symbol('[')) {
                skip_balanced('[', ']');
            } else {
                ++pos_;
            }
        }
        throw ParseError("Unterminated declaration" + line_suffix(start));
    }

    auto parse_type_list() -> std::vector<std::string> {
        std::vector<std::string> names;
        while (true) {
            while (is_symbol(0, '@')) {
                skip_annotation();
            }
            auto qualified = parse_qualified_name();
            auto dot = qualified.rfind('.');
            names.push_back(dot == std::string::npos ? qualified : qualified.substr(dot + 1));
            if (is_symbol(0, '<')) {
                skip_balanced('<', '>');
            }
            if (!is_symbol(0, ',')) {
                return names;
            }
            ++pos_;
        }
    }

    auto parse_type_declaration(TypeKind kind) -> void {
        pos_ += kind == TypeKind::ANNOTATION ? 2 : 1;
        const auto& name_token = expect_identifier();

        auto type_index = index_.types.size();
        index_.types.push_back(TypeDecl{.name = name_token.text, .kind = kind, .line = name_token.line});

        if (is_symbol(0, '<')) {
            skip_balanced('<', '>');
        }
        if (kind == TypeKind::RECORD && is_symbol(0, '(')) {
            skip_balanced('(', ')');
        }

        while (!is_symbol(0, '{')) {
            if (at_end()) {
                throw ParseError("Missing body for type " + name_token.text);
            }
            if (is_identifier(0, "extends")) {
                ++pos_;
                index_.types[type_index].extends = parse_type_list();
            } else if (is_identifier(0, "implements")) {
                ++pos_;
                index_.types[type_index].implements = parse_type_list();
            } else if (is_identifier(0, "permits")) {
                ++pos_;
                parse_type_list();
            } else {
                throw ParseError("Unexpected '" + tokens_[pos_].text + "' in declaration of "
                                 + index_.types[type_index].name + line_suffix(peek(0)));
            }
        }
        ++pos_;  // '{'

        if (kind == TypeKind::ENUM) {
            skip_enum_constants();
        }
        parse_type_body(type_index);

        auto& type = index_.types[type_index];
        type.role = matcher_.classify(type);
    }

    auto skip_enum_constants() -> void {
        while (!at_end()) {
            const auto& token = tokens_[pos_];
            if (token.is_symbol(';')) {
                ++pos_;
                return;
            }
            if (token.is_symbol('}')) {
                return;
            }
            if (token.is_symbol('(')) {
                skip_balanced('(', ')');
            } else if (token.is_symbol('{')) {
                skip_balanced('{', '}');
            } else if (token.is_symbol('@')) {
                skip_annotation();
            } else {
                ++pos_;
            }
        }
        throw ParseError("Unterminated enum body");
    }

    // pos_ is just past the opening brace; consumes through the closing brace
    auto parse_type_body(size_t type_index) -> void {
        std::vector<std::string> modifiers;
        std::optional<size_t> type_start;

        auto reset = [&] {
            modifiers.clear();
            type_start.reset();
        };

        while (true) {
            if (at_end()) {
                throw ParseError("Unterminated body of type " + index_.types[type_index].name);
            }
            const auto& token = tokens_[pos_];

            if (token.is_symbol('}')) {
                ++pos_;
                return;
            }
            if (token.is_symbol(';')) {
                ++pos_;
                reset();
            } else if (auto kind = type_keyword()) {
                parse_type_declaration(*kind);
                reset();
            } else if (token.is_symbol('@')) {
                skip_annotation();
            } else if (token.is_symbol('{')) {
                skip_balanced('{', '}');  // Initializer block
                reset();
            } else if (token.is_symbol('=')) {
                skip_to_semicolon();  // Field initializer
                reset();
            } else if (token.is_symbol('<')) {
                skip_balanced('<', '>');
            } else if (token.kind == TokenKind::IDENTIFIER && is_symbol(1, '(')) {
                std::string return_type;
                if (type_start) {
                    return_type = join_tokens(*type_start, pos_);
                }
                parse_method(type_index, std::move(modifiers), std::move(return_type));
                reset();
            } else if (token.kind == TokenKind::IDENTIFIER && !type_start && is_modifier(token.text)) {
                modifiers.push_back(token.text);
                ++pos_;
            } else {
                if (!type_start) {
                    type_start = pos_;
                }
                ++pos_;
            }
        }
    }

    auto join_tokens(size_t begin, size_t end) const -> std::string {
        std::string text;
        for (size_t i = begin; i < end; ++i) {
            const auto& token = tokens_[i];
            bool needs_space = !text.empty() && token.kind == TokenKind::IDENTIFIER
                               && tokens_[i - 1].kind == TokenKind::IDENTIFIER;
            if (needs_space) {
                text += ' ';
            }
            text += token.text;
        }
        return text;
    }

    // Current token is the method name
    auto parse_method(size_t type_index, std::vector<std::string> modifiers, std::string return_type)
        -> void {
        const auto& name_token = tokens_[pos_++];
        MethodDecl method{
            .name = name_token.text,
            .return_type = std::move(return_type),
            .modifiers = std::move(modifiers),
            .line = name_token.line,
        };
        method.parameter_count = count_parameters();

        while (true) {
            if (at_end()) {
                throw ParseError("Unterminated method " + method.name + line_suffix(&name_token));
            }
            if (is_symbol(0, '{')) {
                method.has_body = true;
                scan_body(method);
                break;
            }
            if (is_symbol(0, ';')) {
                ++pos_;
                break;
            }
            if (is_identifier(0, "default")) {
                skip_to_semicolon();  // Annotation element default value
                break;
            }
            if (is_symbol(0, '}')) {
                throw ParseError("Unexpected '}' after method " + method.name + line_suffix(peek(0)));
            }
            ++pos_;  // throws clause, array dimensions
        }

        index_.types[type_index].methods.push_back(std::move(method));
    }

    // Current token is '('; consumes through the matching ')'
    auto count_parameters() -> size_t {
        const auto* start = peek(0);
        ++pos_;
        size_t paren_depth = 0;
        size_t angle_depth = 0;
        size_t commas = 0;
        bool any_token = false;

        while (!at_end()) {
            const auto& token = tokens_[pos_++];
            if (token.is_symbol(')')) {
                if (paren_depth == 0) {
                    return any_token ? commas + 1 : 0;
                }
                --paren_depth;
            } else if (token.is_symbol('(')) {
                ++paren_depth;
            } else if (token.is_symbol('<')) {
                ++angle_depth;
            } else if (token.is_symbol('>')) {
                angle_depth = angle_depth > 0 ? angle_depth - 1 : 0;
            } else if (token.is_symbol(',') && paren_depth == 0 && angle_depth == 0) {
                ++commas;
            }
            any_token = true;
        }
        throw ParseError("Unterminated parameter list" + line_suffix(start));
    }

    // Current token is '{'; records return statements through the matching '}'
    auto scan_body(MethodDecl& method) -> void {
        const auto* start = peek(0);
        size_t depth = 0;
        while (!at_end()) {
            const auto& token = tokens_[pos_];
            if (token.is_symbol('{')) {
                ++depth;
            } else if (token.is_symbol('}')) {
                if (--depth == 0) {
                    ++pos_;
                    return;
                }
            } else if (token.is_identifier("return")) {
                method.returns.push_back({.line = token.line, .returns_null = is_null_return()});
            }
            ++pos_;
        }
        throw ParseError("Unterminated body of method " + method.name + line_suffix(start));
    }

    // "return null;" or "return (null);" at the current position
    auto is_null_return() const -> bool {
        if (is_identifier(1, "null") && is_symbol(2, ';')) {
            return true;
        }
        return is_symbol(1, '(') && is_identifier(2, "null") && is_symbol(3, ')') && is_symbol(4, ';');
    }

    std::vector<Token> tokens_;
    size_t pos_ = 0;
    const CapabilityMatcher& matcher_;
    SourceIndex index_;
};

} // namespace

auto MethodDecl::has_modifier(std::string_view modifier) const -> bool {
    return std::find(modifiers.begin(), modifiers.end(), modifier) != modifiers.end();
}

auto MethodDecl::first_null_return() const -> std::optional<size_t> {
    for (const auto& statement : returns) {
        if (statement.returns_null) {
            return statement.line;
        }
    }
    return std::nullopt;
}

auto TypeDecl::find_methods(std::string_view method_name, size_t arity) const
    -> std::vector<const MethodDecl*> {
    std::vector<const MethodDecl*> found;
    for (const auto& method : methods) {
        if (method.name == method_name && method.parameter_count == arity) {
            found.push_back(&method);
        }
    }
    return found;
}

auto CapabilityMatcher::classify(const TypeDecl& type) const -> ClassRole {
    if (type.is_interface()) {
        return ClassRole::PLAIN;
    }

    auto contains = [](const std::vector<std::string>& haystack, const std::string& needle) {
        return std::find(haystack.begin(), haystack.end(), needle) != haystack.end();
    };

    for (const auto& name : type.implements) {
        if (contains(capability_interfaces, name)) {
            return ClassRole::CAPABILITY;
        }
    }
    for (const auto& name : type.extends) {
        if (contains(base_classes, name)) {
            return ClassRole::BASE_EXTENDER;
        }
    }
    return ClassRole::PLAIN;
}

auto parse_source(std::string_view source, const CapabilityMatcher& matcher) -> SourceIndex {
    return Parser(tokenize(source), matcher).parse();
}

} // namespace stratify::java

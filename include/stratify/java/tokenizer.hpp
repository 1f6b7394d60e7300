#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace stratify::java {

// Raised for source text the structural index cannot make sense of
class ParseError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class TokenKind {
    IDENTIFIER,  // Keywords included
    SYMBOL,      // Single punctuation character
    LITERAL      // String, text block, character or numeric literal
};

struct Token {
    TokenKind kind = TokenKind::SYMBOL;
    std::string text;
    size_t line{};

    auto is_symbol(char c) const -> bool { return kind == TokenKind::SYMBOL && text.size() == 1 && text[0] == c; }
    auto is_identifier(std::string_view name) const -> bool { return kind == TokenKind::IDENTIFIER && text == name; }
};

// Comments are dropped; line numbers are 1-based
auto tokenize(std::string_view source) -> std::vector<Token>;

} // namespace stratify::java

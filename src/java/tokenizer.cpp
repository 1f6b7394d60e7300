#include "stratify/java/tokenizer.hpp"
#include <cctype>

namespace stratify::java {

namespace {

auto is_identifier_start(char c) -> bool {
    auto u = static_cast<unsigned char>(c);
    return std::isalpha(u) || c == '_' || c == '$' || u >= 0x80;
}

auto is_identifier_part(char c) -> bool {
    return is_identifier_start(c) || std::isdigit(static_cast<unsigned char>(c));
}

class Tokenizer {
public:
    explicit Tokenizer(std::string_view source) : source_(source) {}

    auto run() -> std::vector<Token> {
        while (pos_ < source_.size()) {
            char c = source_[pos_];
            if (c == '\n') {
                ++line_;
                ++pos_;
            } else if (std::isspace(static_cast<unsigned char>(c))) {
                ++pos_;
            } else if (starts_with("//")) {
                skip_line_comment();
            } else if (starts_with("/*")) {
                skip_block_comment();
            } else if (starts_with("\"\"\"")) {
                read_text_block();
            } else if (c == '"' || c == '\'') {
                read_quoted(c);
            } else if (is_identifier_start(c)) {
                read_identifier();
            } else if (std::isdigit(static_cast<unsigned char>(c))) {
                read_number();
            } else {
                tokens_.push_back({.kind = TokenKind::SYMBOL, .text = std::string(1, c), .line = line_});
                ++pos_;
            }
        }
        return std::move(tokens_);
    }

private:
    auto starts_with(std::string_view prefix) const -> bool {
        return source_.substr(pos_).starts_with(prefix);
    }

    auto skip_line_comment() -> void {
        while (pos_ < source_.size() && source_[pos_] != '\n') {
            ++pos_;
        }
    }

    auto skip_block_comment() -> void {
        auto start_line = line_;
        pos_ += 2;
        while (pos_ < source_.size()) {
            if (starts_with("*/")) {
                pos_ += 2;
                return;
            }
            if (source_[pos_] == '\n') {
                ++line_;
            }
            ++pos_;
        }
        throw ParseError("Unterminated comment starting at line " + std::to_string(start_line));
    }

    // Backslash plus the escaped character; a line continuation still ends a line
    auto skip_escape() -> void {
        ++pos_;
        if (pos_ < source_.size()) {
            if (source_[pos_] == '\n') {
                ++line_;
            }
            ++pos_;
        }
    }

    auto read_text_block() -> void {
        auto start_line = line_;
        auto start = pos_;
        pos_ += 3;
        while (pos_ < source_.size()) {
            if (source_[pos_] == '\\') {
                skip_escape();
                continue;
            }
            if (starts_with("\"\"\"")) {
                pos_ += 3;
                tokens_.push_back({.kind = TokenKind::LITERAL,
                                   .text = std::string(source_.substr(start, pos_ - start)),
                                   .line = start_line});
                return;
            }
            if (source_[pos_] == '\n') {
                ++line_;
            }
            ++pos_;
        }
        throw ParseError("Unterminated text block starting at line " + std::to_string(start_line));
    }

    auto read_quoted(char quote) -> void {
        auto start = pos_;
        ++pos_;
        while (pos_ < source_.size()) {
            char c = source_[pos_];
            if (c == '\\') {
                skip_escape();
                continue;
            }
            if (c == '\n') {
                break;
            }
            ++pos_;
            if (c == quote) {
                tokens_.push_back({.kind = TokenKind::LITERAL,
                                   .text = std::string(source_.substr(start, pos_ - start)),
                                   .line = line_});
                return;
            }
        }
        throw ParseError("Unterminated literal at line " + std::to_string(line_));
    }

    auto read_identifier() -> void {
        auto start = pos_;
        while (pos_ < source_.size() && is_identifier_part(source_[pos_])) {
            ++pos_;
        }
        tokens_.push_back({.kind = TokenKind::IDENTIFIER,
                           .text = std::string(source_.substr(start, pos_ - start)),
                           .line = line_});
    }

    auto read_number() -> void {
        auto start = pos_;
        while (pos_ < source_.size()) {
            char c = source_[pos_];
            bool exponent_sign = (c == '+' || c == '-') && pos_ > start
                                 && (source_[pos_ - 1] == 'e' || source_[pos_ - 1] == 'E')
                                 && !source_.substr(start, 2).starts_with("0x");
            if (!is_identifier_part(c) && c != '.' && !exponent_sign) {
                break;
            }
            ++pos_;
        }
        tokens_.push_back({.kind = TokenKind::LITERAL,
                           .text = std::string(source_.substr(start, pos_ - start)),
                           .line = line_});
    }

    std::string_view source_;
    size_t pos_ = 0;
    size_t line_ = 1;
    std::vector<Token> tokens_;
};

} // namespace

auto tokenize(std::string_view source) -> std::vector<Token> {
    return Tokenizer(source).run();
}

} // namespace stratify::java

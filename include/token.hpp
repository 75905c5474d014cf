#pragma once

#include <utility>
#include <string>
#include <variant>

#include "SourceManager.hpp"

enum class TokenType {
    // -----------------------
    // Punctuation (single-character)
    // -----------------------
    OPENPARENTHESIS,
    CLOSEPARENTHESIS,
    OPENBRACE,
    CLOSEBRACE,
    COMMA,
    DOT,
    SEMICOLON,

    // -----------------------
    // Arithmetic
    // -----------------------
    MINUS,
    PLUS,
    SLASH,
    STAR,

    // -----------------------
    // Comparison / assignment (one or two characters)
    // -----------------------
    NOT,
    NOTEQUAL,
    ASSIGN,
    EQUALITY,
    GREATERTHAN,
    GREATEROREQUALTHAN,
    LESSTHAN,
    LESSOREQUALTHAN,

    // -----------------------
    // Literals & identifiers
    // -----------------------
    IDENTIFIER,
    STRING,
    NUMBER,

    // -----------------------
    // Keywords
    // -----------------------
    AND,
    CLASS,
    ELSE,
    FALSE,
    FUN,
    FOR,
    IF,
    NIL,
    OR,
    PRINT,
    RETURN,
    SUPER,
    THIS,
    TRUE,
    VAR,
    WHILE,

    EOF_TOKEN
};

std::string token_type_name(TokenType t);

// Small struct for token location / span in source
struct TokenLocation {
   public:
    std::string filename;  // source filename (or "<repl>")
    int line = 1;          // 1-based
    int col = 1;           // 1-based column of token start
    int length = 0;        // token length in characters

    const SourceManager* src_mgr = nullptr;

    TokenLocation() = default;
    TokenLocation(const std::string& fn, int ln, int c, int len = 0, const SourceManager* mgr = nullptr)
        : filename(fn), line(ln), col(c), length(len), src_mgr(mgr) {}

    std::string to_string() const {
        return filename + ":" + std::to_string(line) + ":" + std::to_string(col);
    }
    std::string get_line_trace() const;
};

// Literal payload of NUMBER and STRING tokens; empty for everything else.
using TokenLiteral = std::variant<std::monostate, double, std::string>;

// Represents a single token with location. Immutable once the lexer emits it.
struct Token {
    TokenType type = TokenType::EOF_TOKEN;
    std::string value;  // lexeme exactly as written in the source
    TokenLiteral literal;
    TokenLocation loc;

    Token() = default;
    Token(TokenType t, const std::string& v, const TokenLocation& l)
        : type(t), value(v), loc(l) {}
    Token(TokenType t, const std::string& v, TokenLiteral lit, const TokenLocation& l)
        : type(t), value(v), literal(std::move(lit)), loc(l) {}

    const std::string& filename() const { return loc.filename; }
    int line() const { return loc.line; }
    int col() const { return loc.col; }
    int length() const { return loc.length; }

    std::string debug_string() const {
        return loc.to_string() + " " + token_type_name(type) + " [" + value + "]";
    }
};

inline std::string TokenLocation::get_line_trace() const {
    if (!src_mgr) {
        return "(source context unavailable)";
    }
    return src_mgr->format_error_context(line, col);
}

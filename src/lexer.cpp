#include "lexer.hpp"

#include <cctype>
#include <cstdlib>
#include <sstream>
#include <unordered_map>

std::string token_type_name(TokenType t) {
    static const std::unordered_map<TokenType, std::string> names = {
        {TokenType::OPENPARENTHESIS, "OPENPARENTHESIS"}, {TokenType::CLOSEPARENTHESIS, "CLOSEPARENTHESIS"},
        {TokenType::OPENBRACE, "OPENBRACE"}, {TokenType::CLOSEBRACE, "CLOSEBRACE"},
        {TokenType::COMMA, "COMMA"}, {TokenType::DOT, "DOT"}, {TokenType::SEMICOLON, "SEMICOLON"},
        {TokenType::MINUS, "MINUS"}, {TokenType::PLUS, "PLUS"}, {TokenType::SLASH, "SLASH"}, {TokenType::STAR, "STAR"},
        {TokenType::NOT, "NOT"}, {TokenType::NOTEQUAL, "NOTEQUAL"},
        {TokenType::ASSIGN, "ASSIGN"}, {TokenType::EQUALITY, "EQUALITY"},
        {TokenType::GREATERTHAN, "GREATERTHAN"}, {TokenType::GREATEROREQUALTHAN, "GREATEROREQUALTHAN"},
        {TokenType::LESSTHAN, "LESSTHAN"}, {TokenType::LESSOREQUALTHAN, "LESSOREQUALTHAN"},
        {TokenType::IDENTIFIER, "IDENTIFIER"}, {TokenType::STRING, "STRING"}, {TokenType::NUMBER, "NUMBER"},
        {TokenType::AND, "AND"}, {TokenType::CLASS, "CLASS"}, {TokenType::ELSE, "ELSE"}, {TokenType::FALSE, "FALSE"},
        {TokenType::FUN, "FUN"}, {TokenType::FOR, "FOR"}, {TokenType::IF, "IF"}, {TokenType::NIL, "NIL"},
        {TokenType::OR, "OR"}, {TokenType::PRINT, "PRINT"}, {TokenType::RETURN, "RETURN"}, {TokenType::SUPER, "SUPER"},
        {TokenType::THIS, "THIS"}, {TokenType::TRUE, "TRUE"}, {TokenType::VAR, "VAR"}, {TokenType::WHILE, "WHILE"},
        {TokenType::EOF_TOKEN, "EOF_TOKEN"}};
    auto it = names.find(t);
    return it != names.end() ? it->second : "TOKEN(?)";
}

// Constructor
Lexer::Lexer(const std::string& source, const std::string& filename, const SourceManager* mgr)
    : src(source), filename(filename), i(0), line(1), col(1), src_mgr(mgr) {}

bool Lexer::eof() const {
    return i >= src.size();
}
char Lexer::peek(size_t offset) const {
    size_t idx = i + offset;
    if (idx >= src.size()) return '\0';
    return src[idx];
}
char Lexer::peek_next() const {
    return peek(1);
}

char Lexer::advance() {
    if (eof()) return '\0';
    char c = src[i++];
    if (c == '\n') {
        line++;
        col = 1;
    } else {
        col++;
    }
    return c;
}

bool Lexer::match(char expected) {
    if (eof() || src[i] != expected) return false;
    advance();
    return true;
}

void Lexer::add_token(std::vector<Token>& out, TokenType type, const std::string& value, int tok_line, int tok_col, int tok_length) {
    int len = tok_length >= 0 ? tok_length : static_cast<int>(value.size());
    TokenLocation loc(filename.empty() ? "<repl>" : filename, tok_line, tok_col, len, src_mgr);
    out.emplace_back(type, value, loc);
}

void Lexer::report(const std::string& message, int tok_line, int tok_col, int tok_length) {
    TokenLocation loc(filename.empty() ? "<repl>" : filename, tok_line, tok_col, tok_length, src_mgr);
    errors_.emplace_back(ErrorKind::Lexical, message, loc);
}

void Lexer::skip_line_comment() {
    while (!eof() && peek() != '\n') advance();
}

// Strings have no escapes and must close on the line they open. On a missing
// quote we report once and resume scanning at the start of the next line.
void Lexer::scan_string(std::vector<Token>& out, int tok_line, int tok_col, size_t start_index) {
    advance();  // opening quote
    while (!eof() && peek() != '"' && peek() != '\n') advance();

    if (eof() || peek() == '\n') {
        report("Unterminated string.", tok_line, tok_col, static_cast<int>(i - start_index));
        return;
    }

    advance();  // closing quote
    std::string lexeme = src.substr(start_index, i - start_index);
    std::string text = lexeme.substr(1, lexeme.size() - 2);

    TokenLocation loc(filename.empty() ? "<repl>" : filename, tok_line, tok_col, static_cast<int>(lexeme.size()), src_mgr);
    out.emplace_back(TokenType::STRING, lexeme, TokenLiteral{text}, loc);
}

// Integer or decimal. No exponent and no leading dot; a trailing '.' that is
// not followed by a digit is left for the DOT token.
void Lexer::scan_number(std::vector<Token>& out, int tok_line, int tok_col, size_t start_index) {
    while (std::isdigit(static_cast<unsigned char>(peek()))) advance();

    if (peek() == '.' && std::isdigit(static_cast<unsigned char>(peek_next()))) {
        advance();  // '.'
        while (std::isdigit(static_cast<unsigned char>(peek()))) advance();
    }

    std::string lexeme = src.substr(start_index, i - start_index);
    // out-of-range literals saturate to inf instead of failing
    double value = std::strtod(lexeme.c_str(), nullptr);

    TokenLocation loc(filename.empty() ? "<repl>" : filename, tok_line, tok_col, static_cast<int>(lexeme.size()), src_mgr);
    out.emplace_back(TokenType::NUMBER, lexeme, TokenLiteral{value}, loc);
}

void Lexer::scan_identifier_or_keyword(std::vector<Token>& out, int tok_line, int tok_col, size_t start_index) {
    static const std::unordered_map<std::string, TokenType> keywords = {
        {"and", TokenType::AND},
        {"class", TokenType::CLASS},
        {"else", TokenType::ELSE},
        {"false", TokenType::FALSE},
        {"for", TokenType::FOR},
        {"fun", TokenType::FUN},
        {"if", TokenType::IF},
        {"nil", TokenType::NIL},
        {"or", TokenType::OR},
        {"print", TokenType::PRINT},
        {"return", TokenType::RETURN},
        {"super", TokenType::SUPER},
        {"this", TokenType::THIS},
        {"true", TokenType::TRUE},
        {"var", TokenType::VAR},
        {"while", TokenType::WHILE},
    };

    while (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '_') advance();

    std::string word = src.substr(start_index, i - start_index);
    auto it = keywords.find(word);
    add_token(out, it != keywords.end() ? it->second : TokenType::IDENTIFIER, word, tok_line, tok_col);
}

void Lexer::scan_token(std::vector<Token>& out) {
    int tok_line = line;
    int tok_col = col;
    size_t start_index = i;
    char c = peek();

    if (c == '"') {
        scan_string(out, tok_line, tok_col, start_index);
        return;
    }
    if (std::isdigit(static_cast<unsigned char>(c))) {
        scan_number(out, tok_line, tok_col, start_index);
        return;
    }
    if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
        scan_identifier_or_keyword(out, tok_line, tok_col, start_index);
        return;
    }

    advance();
    switch (c) {
        case ' ':
        case '\t':
        case '\r':
        case '\n':
            return;
        case '(':
            add_token(out, TokenType::OPENPARENTHESIS, "(", tok_line, tok_col);
            return;
        case ')':
            add_token(out, TokenType::CLOSEPARENTHESIS, ")", tok_line, tok_col);
            return;
        case '{':
            add_token(out, TokenType::OPENBRACE, "{", tok_line, tok_col);
            return;
        case '}':
            add_token(out, TokenType::CLOSEBRACE, "}", tok_line, tok_col);
            return;
        case ',':
            add_token(out, TokenType::COMMA, ",", tok_line, tok_col);
            return;
        case '.':
            add_token(out, TokenType::DOT, ".", tok_line, tok_col);
            return;
        case ';':
            add_token(out, TokenType::SEMICOLON, ";", tok_line, tok_col);
            return;
        case '-':
            add_token(out, TokenType::MINUS, "-", tok_line, tok_col);
            return;
        case '+':
            add_token(out, TokenType::PLUS, "+", tok_line, tok_col);
            return;
        case '*':
            add_token(out, TokenType::STAR, "*", tok_line, tok_col);
            return;
        case '/':
            if (match('/')) {
                skip_line_comment();
            } else {
                add_token(out, TokenType::SLASH, "/", tok_line, tok_col);
            }
            return;
        case '!':
            if (match('='))
                add_token(out, TokenType::NOTEQUAL, "!=", tok_line, tok_col);
            else
                add_token(out, TokenType::NOT, "!", tok_line, tok_col);
            return;
        case '=':
            if (match('='))
                add_token(out, TokenType::EQUALITY, "==", tok_line, tok_col);
            else
                add_token(out, TokenType::ASSIGN, "=", tok_line, tok_col);
            return;
        case '<':
            if (match('='))
                add_token(out, TokenType::LESSOREQUALTHAN, "<=", tok_line, tok_col);
            else
                add_token(out, TokenType::LESSTHAN, "<", tok_line, tok_col);
            return;
        case '>':
            if (match('='))
                add_token(out, TokenType::GREATEROREQUALTHAN, ">=", tok_line, tok_col);
            else
                add_token(out, TokenType::GREATERTHAN, ">", tok_line, tok_col);
            return;
        default: {
            std::ostringstream ss;
            ss << "Unexpected character '" << c << "'.";
            report(ss.str(), tok_line, tok_col);
            return;
        }
    }
}

std::vector<Token> Lexer::tokenize() {
    std::vector<Token> out;
    while (!eof()) {
        scan_token(out);
    }
    add_token(out, TokenType::EOF_TOKEN, "", line, col, 0);
    return out;
}

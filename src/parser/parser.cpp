// src/parser/parser.cpp
#include "parser.hpp"

Parser::Parser(const std::vector<Token>& tokens) : tokens(tokens) {
    // The lexer always terminates the stream, but a hand-built token list may not.
    if (this->tokens.empty() || this->tokens.back().type != TokenType::EOF_TOKEN) {
        TokenLocation loc = this->tokens.empty() ? TokenLocation("<eof>", 1, 1, 0) : this->tokens.back().loc;
        this->tokens.emplace_back(TokenType::EOF_TOKEN, "", loc);
    }
}

// Return current token; never moves past EOF
const Token& Parser::peek() const {
    return tokens[position];
}

const Token& Parser::previous() const {
    return position > 0 ? tokens[position - 1] : tokens[0];
}

bool Parser::is_at_end() const {
    return peek().type == TokenType::EOF_TOKEN;
}

bool Parser::check(TokenType t) const {
    return peek().type == t;
}

// Consume and return the current token (EOF is never consumed)
Token Parser::consume() {
    if (!is_at_end()) position++;
    return previous();
}

bool Parser::match(TokenType t) {
    if (check(t)) {
        consume();
        return true;
    }
    return false;
}

Token Parser::expect(TokenType t, const std::string& errMsg) {
    if (check(t)) return consume();
    throw error_at(peek(), errMsg);
}

Parser::NestingGuard::NestingGuard(Parser& parser, const std::string& message) : parser(parser) {
    if (parser.nesting >= MAX_NESTING) {
        parser.nesting_exceeded = true;
        throw parser.error_at(parser.peek(), message);
    }
    ++parser.nesting;
}

LuxError Parser::error_at(const Token& tok, const std::string& message) const {
    std::string where = tok.type == TokenType::EOF_TOKEN ? "at end" : "at '" + tok.value + "'";
    return LuxError(ErrorKind::Syntax, message, tok.loc, where);
}

void Parser::report(const Token& tok, const std::string& message) {
    errors_.push_back(error_at(tok, message));
}

// Discard tokens until the next statement boundary: just after a ';' or just
// before a keyword that starts a declaration or statement.
void Parser::synchronize() {
    consume();

    while (!is_at_end()) {
        if (previous().type == TokenType::SEMICOLON) return;

        switch (peek().type) {
            case TokenType::CLASS:
            case TokenType::FUN:
            case TokenType::VAR:
            case TokenType::FOR:
            case TokenType::IF:
            case TokenType::WHILE:
            case TokenType::PRINT:
            case TokenType::RETURN:
                return;
            default:
                break;
        }
        consume();
    }
}

std::unique_ptr<ProgramNode> Parser::parse() {
    auto program = std::make_unique<ProgramNode>();
    program->token = peek();
    while (!is_at_end()) {
        try {
            auto stmt = parse_declaration();
            if (stmt) program->body.push_back(std::move(stmt));
        } catch (const LuxError& e) {
            // too deep to recover from; report once and stop
            errors_.push_back(e);
            break;
        }
    }
    return program;
}

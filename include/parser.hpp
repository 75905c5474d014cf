#pragma once
#include <memory>
#include <string>
#include <vector>

#include "LuxError.hpp"
#include "ast.hpp"
#include "token.hpp"

class Parser {
   public:
    // Upper bound on declared parameters and on call arguments.
    static constexpr size_t MAX_ARITY = 255;
    // Upper bound on nested statements and sub-expressions.
    static constexpr size_t MAX_NESTING = 256;

    Parser(const std::vector<Token>& tokens);

    // Parses every declaration it can. Syntax errors are recorded in errors()
    // and the parser resynchronizes at the next statement boundary, so the
    // returned program is only meaningful when had_error() is false.
    std::unique_ptr<ProgramNode> parse();

    const std::vector<LuxError>& errors() const { return errors_; }
    bool had_error() const { return !errors_.empty(); }

   private:
    std::vector<Token> tokens;
    size_t position = 0;
    std::vector<LuxError> errors_;
    size_t nesting = 0;
    // Set once MAX_NESTING is hit; the error then unwinds the whole parse.
    bool nesting_exceeded = false;

    struct NestingGuard {
        Parser& parser;
        NestingGuard(Parser& parser, const std::string& message);
        ~NestingGuard() { --parser.nesting; }
    };

    const Token& peek() const;
    const Token& previous() const;
    bool is_at_end() const;
    bool check(TokenType t) const;

    Token consume();
    bool match(TokenType t);
    Token expect(TokenType t, const std::string& errMsg);

    // Builds (does not record) a syntax error pointing at tok.
    LuxError error_at(const Token& tok, const std::string& message) const;
    // Records an error without unwinding the current statement.
    void report(const Token& tok, const std::string& message);
    void synchronize();

    // expression parsing (precedence chain, lowest first)
    std::unique_ptr<ExpressionNode> parse_expression();
    std::unique_ptr<ExpressionNode> parse_assignment();
    std::unique_ptr<ExpressionNode> parse_logical_or();
    std::unique_ptr<ExpressionNode> parse_logical_and();
    std::unique_ptr<ExpressionNode> parse_equality();
    std::unique_ptr<ExpressionNode> parse_comparison();
    std::unique_ptr<ExpressionNode> parse_additive();
    std::unique_ptr<ExpressionNode> parse_multiplicative();
    std::unique_ptr<ExpressionNode> parse_unary();
    std::unique_ptr<ExpressionNode> parse_call();
    std::unique_ptr<ExpressionNode> parse_primary();
    std::unique_ptr<ExpressionNode> finish_call(std::unique_ptr<ExpressionNode> callee);

    // statements
    std::unique_ptr<StatementNode> parse_declaration();
    std::unique_ptr<StatementNode> parse_statement();
    std::unique_ptr<StatementNode> parse_variable_declaration();
    std::unique_ptr<StatementNode> parse_print_statement();
    std::unique_ptr<StatementNode> parse_expression_statement();
    std::unique_ptr<StatementNode> parse_return_statement();

    // function parsing
    std::unique_ptr<FunctionDeclarationNode> parse_function(const std::string& kind);
    std::unique_ptr<StatementNode> parse_class_declaration();

    // control-flow parsing
    std::unique_ptr<StatementNode> parse_if_statement();
    std::unique_ptr<StatementNode> parse_while_statement();
    std::unique_ptr<StatementNode> parse_for_statement();

    // '{' already consumed; reads statements up to and including '}'
    std::vector<std::unique_ptr<StatementNode>> parse_block();
};

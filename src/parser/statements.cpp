// src/parser/statements.cpp
#include "parser.hpp"

std::unique_ptr<StatementNode> Parser::parse_declaration() {
    NestingGuard guard(*this, "Statement nested too deeply.");
    try {
        if (match(TokenType::CLASS)) return parse_class_declaration();
        if (match(TokenType::FUN)) return parse_function("function");
        if (match(TokenType::VAR)) return parse_variable_declaration();
        return parse_statement();
    } catch (const LuxError& e) {
        if (nesting_exceeded) throw;
        errors_.push_back(e);
        synchronize();
        return nullptr;
    }
}

std::unique_ptr<StatementNode> Parser::parse_statement() {
    NestingGuard guard(*this, "Statement nested too deeply.");
    if (match(TokenType::FOR)) return parse_for_statement();
    if (match(TokenType::IF)) return parse_if_statement();
    if (match(TokenType::PRINT)) return parse_print_statement();
    if (match(TokenType::RETURN)) return parse_return_statement();
    if (match(TokenType::WHILE)) return parse_while_statement();
    if (check(TokenType::OPENBRACE)) {
        Token brace = consume();
        auto block = std::make_unique<BlockStatementNode>();
        block->token = brace;
        block->body = parse_block();
        return block;
    }
    return parse_expression_statement();
}

// var <name> ( = <expr> )? ;
std::unique_ptr<StatementNode> Parser::parse_variable_declaration() {
    Token nameTok = expect(TokenType::IDENTIFIER, "Expect variable name.");

    auto node = std::make_unique<VariableDeclarationNode>();
    node->token = nameTok;
    node->identifier = nameTok.value;
    if (match(TokenType::ASSIGN)) {
        node->value = parse_expression();
    }
    expect(TokenType::SEMICOLON, "Expect ';' after variable declaration.");
    return node;
}

std::unique_ptr<StatementNode> Parser::parse_print_statement() {
    auto node = std::make_unique<PrintStatementNode>();
    node->token = previous();
    node->expression = parse_expression();
    expect(TokenType::SEMICOLON, "Expect ';' after value.");
    return node;
}

std::unique_ptr<StatementNode> Parser::parse_expression_statement() {
    auto node = std::make_unique<ExpressionStatementNode>();
    node->token = peek();
    node->expression = parse_expression();
    expect(TokenType::SEMICOLON, "Expect ';' after expression.");
    return node;
}

// 'return' outside a function is a resolution error, not a syntax error.
std::unique_ptr<StatementNode> Parser::parse_return_statement() {
    auto node = std::make_unique<ReturnStatementNode>();
    node->token = previous();
    if (!check(TokenType::SEMICOLON)) {
        node->value = parse_expression();
    }
    expect(TokenType::SEMICOLON, "Expect ';' after return value.");
    return node;
}

std::vector<std::unique_ptr<StatementNode>> Parser::parse_block() {
    std::vector<std::unique_ptr<StatementNode>> body;
    while (!check(TokenType::CLOSEBRACE) && !is_at_end()) {
        auto stmt = parse_declaration();
        if (stmt) body.push_back(std::move(stmt));
    }
    expect(TokenType::CLOSEBRACE, "Expect '}' after block.");
    return body;
}

// kind is "function" or "method"; only used in messages
std::unique_ptr<FunctionDeclarationNode> Parser::parse_function(const std::string& kind) {
    Token nameTok = expect(TokenType::IDENTIFIER, "Expect " + kind + " name.");

    auto fn = std::make_unique<FunctionDeclarationNode>();
    fn->token = nameTok;
    fn->name = nameTok.value;

    expect(TokenType::OPENPARENTHESIS, "Expect '(' after " + kind + " name.");
    if (!check(TokenType::CLOSEPARENTHESIS)) {
        do {
            if (fn->parameters.size() >= MAX_ARITY) {
                report(peek(), "Can't have more than " + std::to_string(MAX_ARITY) + " parameters.");
            }
            Token paramTok = expect(TokenType::IDENTIFIER, "Expect parameter name.");
            auto param = std::make_unique<ParameterNode>();
            param->token = paramTok;
            param->name = paramTok.value;
            fn->parameters.push_back(std::move(param));
        } while (match(TokenType::COMMA));
    }
    expect(TokenType::CLOSEPARENTHESIS, "Expect ')' after parameters.");

    expect(TokenType::OPENBRACE, "Expect '{' before " + kind + " body.");
    fn->body = parse_block();
    return fn;
}

// class <Name> ( < <Super> )? { method* }
std::unique_ptr<StatementNode> Parser::parse_class_declaration() {
    Token nameTok = expect(TokenType::IDENTIFIER, "Expect class name.");

    auto cls = std::make_unique<ClassDeclarationNode>();
    cls->token = nameTok;
    cls->name = std::make_unique<IdentifierNode>();
    cls->name->token = nameTok;
    cls->name->name = nameTok.value;

    if (match(TokenType::LESSTHAN)) {
        Token superTok = expect(TokenType::IDENTIFIER, "Expect superclass name.");
        cls->superClass = std::make_unique<IdentifierNode>();
        cls->superClass->token = superTok;
        cls->superClass->name = superTok.value;
    }

    expect(TokenType::OPENBRACE, "Expect '{' before class body.");
    while (!check(TokenType::CLOSEBRACE) && !is_at_end()) {
        cls->methods.push_back(parse_function("method"));
    }
    expect(TokenType::CLOSEBRACE, "Expect '}' after class body.");
    return cls;
}

std::unique_ptr<StatementNode> Parser::parse_if_statement() {
    auto node = std::make_unique<IfStatementNode>();
    node->token = previous();

    expect(TokenType::OPENPARENTHESIS, "Expect '(' after 'if'.");
    node->condition = parse_expression();
    expect(TokenType::CLOSEPARENTHESIS, "Expect ')' after if condition.");

    node->then_branch = parse_statement();
    // a dangling else binds to the nearest if
    if (match(TokenType::ELSE)) {
        node->else_branch = parse_statement();
    }
    return node;
}

std::unique_ptr<StatementNode> Parser::parse_while_statement() {
    auto node = std::make_unique<WhileStatementNode>();
    node->token = previous();

    expect(TokenType::OPENPARENTHESIS, "Expect '(' after 'while'.");
    node->condition = parse_expression();
    expect(TokenType::CLOSEPARENTHESIS, "Expect ')' after condition.");
    node->body = parse_statement();
    return node;
}

// for (init; cond; incr) body  ==>  { init; while (cond) { body; incr; } }
// The outer block exists only when there is an initializer; the inner block
// only when there is an increment. The resolver and the evaluator both see
// the desugared form, so they open the same scopes.
std::unique_ptr<StatementNode> Parser::parse_for_statement() {
    Token forTok = previous();
    expect(TokenType::OPENPARENTHESIS, "Expect '(' after 'for'.");

    std::unique_ptr<StatementNode> initializer;
    if (match(TokenType::SEMICOLON)) {
        // no initializer
    } else if (match(TokenType::VAR)) {
        initializer = parse_variable_declaration();
    } else {
        initializer = parse_expression_statement();
    }

    std::unique_ptr<ExpressionNode> condition;
    if (!check(TokenType::SEMICOLON)) {
        condition = parse_expression();
    }
    expect(TokenType::SEMICOLON, "Expect ';' after loop condition.");

    std::unique_ptr<ExpressionNode> increment;
    if (!check(TokenType::CLOSEPARENTHESIS)) {
        increment = parse_expression();
    }
    expect(TokenType::CLOSEPARENTHESIS, "Expect ')' after for clauses.");

    std::unique_ptr<StatementNode> body = parse_statement();

    if (increment) {
        auto incStmt = std::make_unique<ExpressionStatementNode>();
        incStmt->token = increment->token;
        incStmt->expression = std::move(increment);

        auto block = std::make_unique<BlockStatementNode>();
        block->token = forTok;
        block->body.push_back(std::move(body));
        block->body.push_back(std::move(incStmt));
        body = std::move(block);
    }

    if (!condition) {
        auto always = std::make_unique<BooleanLiteralNode>();
        always->token = forTok;
        always->value = true;
        condition = std::move(always);
    }

    auto loop = std::make_unique<WhileStatementNode>();
    loop->token = forTok;
    loop->condition = std::move(condition);
    loop->body = std::move(body);

    if (!initializer) return loop;

    auto outer = std::make_unique<BlockStatementNode>();
    outer->token = forTok;
    outer->body.push_back(std::move(initializer));
    outer->body.push_back(std::move(loop));
    return outer;
}

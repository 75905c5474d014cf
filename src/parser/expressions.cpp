// src/parser/expressions.cpp
#include "parser.hpp"

std::unique_ptr<ExpressionNode> Parser::parse_expression() {
    return parse_assignment();
}

// Right-associative. The left side is parsed as an ordinary expression and
// then checked: only a variable or a property access can be assigned to.
std::unique_ptr<ExpressionNode> Parser::parse_assignment() {
    NestingGuard guard(*this, "Expression nested too deeply.");
    auto expr = parse_logical_or();

    if (check(TokenType::ASSIGN)) {
        Token equals = consume();
        auto value = parse_assignment();

        if (auto id = dynamic_cast<IdentifierNode*>(expr.get())) {
            auto node = std::make_unique<AssignmentExpressionNode>();
            node->token = id->token;
            node->name = id->name;
            node->value = std::move(value);
            return node;
        }
        if (auto mem = dynamic_cast<MemberExpressionNode*>(expr.get())) {
            auto node = std::make_unique<MemberAssignmentNode>();
            node->token = mem->token;
            node->object = std::move(mem->object);
            node->property = mem->property;
            node->value = std::move(value);
            return node;
        }

        // Not worth unwinding the statement for; keep parsing.
        report(equals, "Invalid assignment target.");
    }
    return expr;
}

std::unique_ptr<ExpressionNode> Parser::parse_logical_or() {
    auto left = parse_logical_and();
    while (check(TokenType::OR)) {
        Token opTok = consume();
        auto node = std::make_unique<LogicalExpressionNode>();
        node->token = opTok;
        node->op = opTok.value;
        node->left = std::move(left);
        node->right = parse_logical_and();
        left = std::move(node);
    }
    return left;
}

std::unique_ptr<ExpressionNode> Parser::parse_logical_and() {
    auto left = parse_equality();
    while (check(TokenType::AND)) {
        Token opTok = consume();
        auto node = std::make_unique<LogicalExpressionNode>();
        node->token = opTok;
        node->op = opTok.value;
        node->left = std::move(left);
        node->right = parse_equality();
        left = std::move(node);
    }
    return left;
}

std::unique_ptr<ExpressionNode> Parser::parse_equality() {
    auto left = parse_comparison();
    while (check(TokenType::EQUALITY) || check(TokenType::NOTEQUAL)) {
        Token opTok = consume();
        auto node = std::make_unique<BinaryExpressionNode>();
        node->token = opTok;
        node->op = opTok.value;
        node->left = std::move(left);
        node->right = parse_comparison();
        left = std::move(node);
    }
    return left;
}

std::unique_ptr<ExpressionNode> Parser::parse_comparison() {
    auto left = parse_additive();
    while (check(TokenType::GREATERTHAN) || check(TokenType::GREATEROREQUALTHAN) ||
        check(TokenType::LESSTHAN) || check(TokenType::LESSOREQUALTHAN)) {
        Token opTok = consume();
        auto node = std::make_unique<BinaryExpressionNode>();
        node->token = opTok;
        node->op = opTok.value;
        node->left = std::move(left);
        node->right = parse_additive();
        left = std::move(node);
    }
    return left;
}

std::unique_ptr<ExpressionNode> Parser::parse_additive() {
    auto left = parse_multiplicative();
    while (check(TokenType::PLUS) || check(TokenType::MINUS)) {
        Token opTok = consume();
        auto node = std::make_unique<BinaryExpressionNode>();
        node->token = opTok;
        node->op = opTok.value;
        node->left = std::move(left);
        node->right = parse_multiplicative();
        left = std::move(node);
    }
    return left;
}

std::unique_ptr<ExpressionNode> Parser::parse_multiplicative() {
    auto left = parse_unary();
    while (check(TokenType::STAR) || check(TokenType::SLASH)) {
        Token opTok = consume();
        auto node = std::make_unique<BinaryExpressionNode>();
        node->token = opTok;
        node->op = opTok.value;
        node->left = std::move(left);
        node->right = parse_unary();
        left = std::move(node);
    }
    return left;
}

std::unique_ptr<ExpressionNode> Parser::parse_unary() {
    if (check(TokenType::NOT) || check(TokenType::MINUS)) {
        NestingGuard guard(*this, "Expression nested too deeply.");
        Token opTok = consume();
        auto node = std::make_unique<UnaryExpressionNode>();
        node->token = opTok;
        node->op = opTok.value;
        node->operand = parse_unary();
        return node;
    }
    return parse_call();
}

// Postfix chain: f(a)(b).c.d(e) applies left to right.
std::unique_ptr<ExpressionNode> Parser::parse_call() {
    auto expr = parse_primary();

    while (true) {
        if (match(TokenType::OPENPARENTHESIS)) {
            expr = finish_call(std::move(expr));
        } else if (match(TokenType::DOT)) {
            Token nameTok = expect(TokenType::IDENTIFIER, "Expect property name after '.'.");
            auto mem = std::make_unique<MemberExpressionNode>();
            mem->token = nameTok;
            mem->object = std::move(expr);
            mem->property = nameTok.value;
            expr = std::move(mem);
        } else {
            break;
        }
    }
    return expr;
}

std::unique_ptr<ExpressionNode> Parser::finish_call(std::unique_ptr<ExpressionNode> callee) {
    auto call = std::make_unique<CallExpressionNode>();
    call->callee = std::move(callee);

    if (!check(TokenType::CLOSEPARENTHESIS)) {
        do {
            if (call->arguments.size() >= MAX_ARITY) {
                report(peek(), "Can't have more than " + std::to_string(MAX_ARITY) + " arguments.");
            }
            call->arguments.push_back(parse_expression());
        } while (match(TokenType::COMMA));
    }

    call->token = expect(TokenType::CLOSEPARENTHESIS, "Expect ')' after arguments.");
    return call;
}

std::unique_ptr<ExpressionNode> Parser::parse_primary() {
    Token t = peek();

    switch (t.type) {
        case TokenType::FALSE:
        case TokenType::TRUE: {
            consume();
            auto node = std::make_unique<BooleanLiteralNode>();
            node->token = t;
            node->value = t.type == TokenType::TRUE;
            return node;
        }
        case TokenType::NIL: {
            consume();
            auto node = std::make_unique<NilNode>();
            node->token = t;
            return node;
        }
        case TokenType::NUMBER: {
            consume();
            auto node = std::make_unique<NumericLiteralNode>();
            node->token = t;
            node->value = std::get<double>(t.literal);
            return node;
        }
        case TokenType::STRING: {
            consume();
            auto node = std::make_unique<StringLiteralNode>();
            node->token = t;
            node->value = std::get<std::string>(t.literal);
            return node;
        }
        case TokenType::THIS: {
            consume();
            auto node = std::make_unique<ThisExpressionNode>();
            node->token = t;
            return node;
        }
        case TokenType::SUPER: {
            consume();
            expect(TokenType::DOT, "Expect '.' after 'super'.");
            Token method = expect(TokenType::IDENTIFIER, "Expect superclass method name.");
            auto node = std::make_unique<SuperExpressionNode>();
            node->token = t;
            node->method = method.value;
            return node;
        }
        case TokenType::IDENTIFIER: {
            consume();
            auto node = std::make_unique<IdentifierNode>();
            node->token = t;
            node->name = t.value;
            return node;
        }
        case TokenType::OPENPARENTHESIS: {
            consume();
            auto node = std::make_unique<GroupingNode>();
            node->token = t;
            node->expression = parse_expression();
            expect(TokenType::CLOSEPARENTHESIS, "Expect ')' after expression.");
            return node;
        }
        default:
            throw error_at(t, "Expect expression.");
    }
}

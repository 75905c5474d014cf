// src/resolver/Resolver.cpp
#include "resolver.hpp"

#include "lexical_scope.hpp"

ResolutionTable Resolver::resolve(const ProgramNode* program) {
    scopes.clear();
    locals.clear();
    errors_.clear();
    current_function = FunctionKind::NONE;
    current_class = ClassKind::NONE;

    if (program) resolve_statements(program->body);
    return locals;
}

// ----------------- Scope bookkeeping -----------------

void Resolver::begin_scope() {
    scopes.emplace_back();
}

void Resolver::end_scope() {
    scopes.pop_back();
}

// Globals are not tracked, so redeclaring one is allowed.
void Resolver::declare(const Token& name) {
    if (scopes.empty()) return;
    auto& scope = scopes.back();
    if (scope.count(name.value)) {
        report(name, "Already a variable with this name in this scope.");
    }
    scope[name.value] = false;
}

void Resolver::define(const std::string& name) {
    if (scopes.empty()) return;
    scopes.back()[name] = true;
}

void Resolver::resolve_local(const ExpressionNode* expr, const std::string& name) {
    for (int i = static_cast<int>(scopes.size()) - 1; i >= 0; --i) {
        if (scopes[i].count(name)) {
            locals[expr] = static_cast<int>(scopes.size()) - 1 - i;
            return;
        }
    }
    // not found: global, looked up by name at runtime
}

void Resolver::report(const Token& tok, const std::string& message) {
    std::string where = tok.type == TokenType::EOF_TOKEN ? "at end" : "at '" + tok.value + "'";
    errors_.emplace_back(ErrorKind::Resolution, message, tok.loc, where);
}

// ----------------- Statements -----------------

void Resolver::resolve_statements(const std::vector<std::unique_ptr<StatementNode>>& body) {
    for (const auto& stmt : body) resolve_statement(stmt.get());
}

void Resolver::resolve_statement(const StatementNode* stmt) {
    if (!stmt) return;

    if (auto block = dynamic_cast<const BlockStatementNode*>(stmt)) {
        begin_scope();
        resolve_statements(block->body);
        end_scope();
        return;
    }

    // declare, then initializer, then define: 'var a = a;' in a local scope
    // sees 'a' as declared-but-undefined
    if (auto vd = dynamic_cast<const VariableDeclarationNode*>(stmt)) {
        declare(vd->token);
        if (vd->value) resolve_expression(vd->value.get());
        define(vd->identifier);
        return;
    }

    // the name is defined before the body so the function can recurse
    if (auto fn = dynamic_cast<const FunctionDeclarationNode*>(stmt)) {
        declare(fn->token);
        define(fn->name);
        resolve_function(fn, FunctionKind::FUNCTION);
        return;
    }

    if (auto cd = dynamic_cast<const ClassDeclarationNode*>(stmt)) {
        ClassKind enclosing_class = current_class;
        current_class = ClassKind::CLASS;

        declare(cd->name->token);
        define(cd->name->name);

        if (cd->superClass) {
            if (cd->superClass->name == cd->name->name) {
                report(cd->superClass->token, "A class can't inherit from itself.");
            }
            current_class = ClassKind::SUBCLASS;
            resolve_expression(cd->superClass.get());

            begin_scope();
            scopes.back()[SUPER_NAME] = true;
        }

        begin_scope();
        scopes.back()[THIS_NAME] = true;

        for (const auto& method : cd->methods) {
            FunctionKind kind = method->name == INITIALIZER_NAME ? FunctionKind::INITIALIZER : FunctionKind::METHOD;
            resolve_function(method.get(), kind);
        }

        end_scope();
        if (cd->superClass) end_scope();

        current_class = enclosing_class;
        return;
    }

    if (auto es = dynamic_cast<const ExpressionStatementNode*>(stmt)) {
        resolve_expression(es->expression.get());
        return;
    }

    if (auto ps = dynamic_cast<const PrintStatementNode*>(stmt)) {
        resolve_expression(ps->expression.get());
        return;
    }

    if (auto ifn = dynamic_cast<const IfStatementNode*>(stmt)) {
        resolve_expression(ifn->condition.get());
        resolve_statement(ifn->then_branch.get());
        if (ifn->else_branch) resolve_statement(ifn->else_branch.get());
        return;
    }

    if (auto wn = dynamic_cast<const WhileStatementNode*>(stmt)) {
        resolve_expression(wn->condition.get());
        resolve_statement(wn->body.get());
        return;
    }

    if (auto rs = dynamic_cast<const ReturnStatementNode*>(stmt)) {
        if (current_function == FunctionKind::NONE) {
            report(rs->token, "Can't return from top-level code.");
        }
        if (rs->value) {
            if (current_function == FunctionKind::INITIALIZER) {
                report(rs->token, "Can't return a value from an initializer.");
            }
            resolve_expression(rs->value.get());
        }
        return;
    }
}

// Parameters and body share one scope, matching the single environment the
// evaluator creates per call.
void Resolver::resolve_function(const FunctionDeclarationNode* fn, FunctionKind kind) {
    FunctionKind enclosing_function = current_function;
    current_function = kind;

    begin_scope();
    for (const auto& param : fn->parameters) {
        declare(param->token);
        define(param->name);
    }
    resolve_statements(fn->body);
    end_scope();

    current_function = enclosing_function;
}

// ----------------- Expressions -----------------

void Resolver::resolve_expression(const ExpressionNode* expr) {
    if (!expr) return;

    if (auto id = dynamic_cast<const IdentifierNode*>(expr)) {
        if (!scopes.empty()) {
            auto it = scopes.back().find(id->name);
            if (it != scopes.back().end() && !it->second) {
                report(id->token, "Can't read local variable in its own initializer.");
            }
        }
        resolve_local(id, id->name);
        return;
    }

    if (auto an = dynamic_cast<const AssignmentExpressionNode*>(expr)) {
        resolve_expression(an->value.get());
        resolve_local(an, an->name);
        return;
    }

    if (auto b = dynamic_cast<const BinaryExpressionNode*>(expr)) {
        resolve_expression(b->left.get());
        resolve_expression(b->right.get());
        return;
    }

    if (auto l = dynamic_cast<const LogicalExpressionNode*>(expr)) {
        resolve_expression(l->left.get());
        resolve_expression(l->right.get());
        return;
    }

    if (auto u = dynamic_cast<const UnaryExpressionNode*>(expr)) {
        resolve_expression(u->operand.get());
        return;
    }

    if (auto g = dynamic_cast<const GroupingNode*>(expr)) {
        resolve_expression(g->expression.get());
        return;
    }

    if (auto call = dynamic_cast<const CallExpressionNode*>(expr)) {
        resolve_expression(call->callee.get());
        for (const auto& arg : call->arguments) resolve_expression(arg.get());
        return;
    }

    // property names are looked up dynamically; only the object is resolved
    if (auto mem = dynamic_cast<const MemberExpressionNode*>(expr)) {
        resolve_expression(mem->object.get());
        return;
    }

    if (auto ma = dynamic_cast<const MemberAssignmentNode*>(expr)) {
        resolve_expression(ma->value.get());
        resolve_expression(ma->object.get());
        return;
    }

    if (auto th = dynamic_cast<const ThisExpressionNode*>(expr)) {
        if (current_class == ClassKind::NONE) {
            report(th->token, "Can't use 'this' outside of a class.");
            return;
        }
        resolve_local(th, THIS_NAME);
        return;
    }

    if (auto sup = dynamic_cast<const SuperExpressionNode*>(expr)) {
        if (current_class == ClassKind::NONE) {
            report(sup->token, "Can't use 'super' outside of a class.");
        } else if (current_class != ClassKind::SUBCLASS) {
            report(sup->token, "Can't use 'super' in a class with no superclass.");
        }
        resolve_local(sup, SUPER_NAME);
        return;
    }

    // literals have nothing to resolve
}

// src/evaluator/StatementEval.cpp
#include "ClassRuntime.hpp"
#include "evaluator.hpp"
#include "lexical_scope.hpp"

void Evaluator::execute_block(const std::vector<std::unique_ptr<StatementNode>>& body, EnvPtr env, Value* return_value, bool* did_return) {
    for (auto& stmt : body) {
        evaluate_statement(stmt.get(), env, return_value, did_return);
        if (did_return && *did_return) return;
    }
}

void Evaluator::evaluate_statement(StatementNode* node, EnvPtr env, Value* return_value, bool* did_return) {
    if (!node) return;

    if (auto es = dynamic_cast<ExpressionStatementNode*>(node)) {
        evaluate_expression(es->expression.get(), env);
        return;
    }

    if (auto ps = dynamic_cast<PrintStatementNode*>(node)) {
        Value v = evaluate_expression(ps->expression.get(), env);
        out << value_to_string(v) << "\n";
        return;
    }

    if (auto vd = dynamic_cast<VariableDeclarationNode*>(node)) {
        Value val = std::monostate{};
        if (vd->value) val = evaluate_expression(vd->value.get(), env);
        env->define(vd->identifier, val);
        return;
    }

    if (auto block = dynamic_cast<BlockStatementNode*>(node)) {
        auto blockEnv = std::make_shared<Environment>(env);
        execute_block(block->body, blockEnv, return_value, did_return);
        return;
    }

    // branches run in the current scope; a braced branch opens its own block
    if (auto ifn = dynamic_cast<IfStatementNode*>(node)) {
        Value cond = evaluate_expression(ifn->condition.get(), env);
        if (to_bool(cond)) {
            evaluate_statement(ifn->then_branch.get(), env, return_value, did_return);
        } else if (ifn->else_branch) {
            evaluate_statement(ifn->else_branch.get(), env, return_value, did_return);
        }
        return;
    }

    if (auto wn = dynamic_cast<WhileStatementNode*>(node)) {
        while (to_bool(evaluate_expression(wn->condition.get(), env))) {
            evaluate_statement(wn->body.get(), env, return_value, did_return);
            if (did_return && *did_return) return;
        }
        return;
    }

    if (auto fd = dynamic_cast<FunctionDeclarationNode*>(node)) {
        auto fn = std::make_shared<FunctionValue>(fd, env);
        env->define(fd->name, fn);
        return;
    }

    if (auto rs = dynamic_cast<ReturnStatementNode*>(node)) {
        Value val = std::monostate{};
        if (rs->value) val = evaluate_expression(rs->value.get(), env);
        if (return_value) *return_value = val;
        if (did_return) *did_return = true;
        return;
    }

    if (auto cd = dynamic_cast<ClassDeclarationNode*>(node)) {
        ClassPtr superclass = nullptr;
        if (cd->superClass) {
            Value sv = evaluate_expression(cd->superClass.get(), env);
            if (!std::holds_alternative<ClassPtr>(sv)) {
                throw runtime_error(cd->superClass->token, "Superclass must be a class.");
            }
            superclass = std::get<ClassPtr>(sv);
        }

        // bound first so methods can refer to the class by name
        env->define(cd->name->name, std::monostate{});

        EnvPtr classEnv = env;
        if (superclass) {
            classEnv = std::make_shared<Environment>(env);
            classEnv->define(SUPER_NAME, superclass);
        }

        auto klass = std::make_shared<ClassValue>();
        klass->name = cd->name->name;
        klass->super = superclass;
        klass->token = cd->token;
        for (auto& method : cd->methods) {
            bool is_init = method->name == INITIALIZER_NAME;
            klass->methods[method->name] = std::make_shared<FunctionValue>(method.get(), classEnv, is_init);
        }

        env->assign(cd->name->token, klass);
        return;
    }

    throw runtime_error(node->token, "Unsupported statement node.");
}

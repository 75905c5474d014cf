// src/evaluator/Evaluator.cpp
#include "evaluator.hpp"

#include "ClassRuntime.hpp"
#include "globals.hpp"

Evaluator::~Evaluator() = default;

Evaluator::Evaluator(EnvPtr globals, std::ostream& out)
    : global_env(globals ? globals : std::make_shared<Environment>(nullptr)), out(out) {
    if (!globals) init_globals(global_env);
}

void Evaluator::add_resolutions(const ResolutionTable& table) {
    for (const auto& entry : table) locals[entry.first] = entry.second;
}

void Evaluator::evaluate(ProgramNode* program, const ResolutionTable& table) {
    if (!program) return;
    add_resolutions(table);
    call_depth = 0;

    Value ret;
    bool did_return = false;
    for (auto& stmt : program->body) {
        evaluate_statement(stmt.get(), global_env, &ret, &did_return);
        if (did_return) break;
    }
}

Value Evaluator::evaluate_expression(ExpressionNode* expr, const ResolutionTable& table) {
    add_resolutions(table);
    call_depth = 0;
    return evaluate_expression(expr, global_env);
}

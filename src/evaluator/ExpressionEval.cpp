// src/evaluator/ExpressionEval.cpp
#include "ClassRuntime.hpp"
#include "evaluator.hpp"
#include "lexical_scope.hpp"

Value Evaluator::lookup_variable(const std::string& name, const ExpressionNode* expr, const Token& tok, EnvPtr env) {
    auto it = locals.find(expr);
    if (it != locals.end()) return env->get_at(it->second, name, tok);
    return global_env->get(tok);
}

Value Evaluator::get_property(const Value& object, const std::string& name, const Token& tok) {
    if (!std::holds_alternative<InstancePtr>(object)) {
        throw runtime_error(tok, "Only instances have properties.");
    }
    InstancePtr inst = std::get<InstancePtr>(object);

    // fields shadow methods
    auto fit = inst->fields.find(name);
    if (fit != inst->fields.end()) return fit->second;

    if (inst->klass) {
        FunctionPtr method = inst->klass->find_method(name);
        if (method) return method->bind(inst);
    }
    throw runtime_error(tok, "Undefined property '" + name + "'.");
}

Value Evaluator::evaluate_expression(ExpressionNode* node, EnvPtr env) {
    if (!node) return std::monostate{};

    if (auto n = dynamic_cast<NumericLiteralNode*>(node)) {
        return n->value;
    }
    if (auto s = dynamic_cast<StringLiteralNode*>(node)) {
        return s->value;
    }
    if (auto b = dynamic_cast<BooleanLiteralNode*>(node)) {
        return b->value;
    }
    if (dynamic_cast<NilNode*>(node)) {
        return std::monostate{};
    }

    if (auto g = dynamic_cast<GroupingNode*>(node)) {
        return evaluate_expression(g->expression.get(), env);
    }

    if (auto id = dynamic_cast<IdentifierNode*>(node)) {
        return lookup_variable(id->name, id, id->token, env);
    }

    if (auto an = dynamic_cast<AssignmentExpressionNode*>(node)) {
        Value value = evaluate_expression(an->value.get(), env);
        auto it = locals.find(an);
        if (it != locals.end()) {
            env->assign_at(it->second, an->name, value, an->token);
        } else {
            global_env->assign(an->token, value);
        }
        return value;
    }

    if (auto u = dynamic_cast<UnaryExpressionNode*>(node)) {
        Value operand = evaluate_expression(u->operand.get(), env);
        if (u->op == "-") {
            return -to_number(operand, u->token, "Operand must be a number.");
        }
        if (u->op == "!") {
            return !to_bool(operand);
        }
        throw runtime_error(u->token, "Unknown unary operator '" + u->op + "'.");
    }

    // only the left operand is evaluated when it decides the result
    if (auto l = dynamic_cast<LogicalExpressionNode*>(node)) {
        Value left = evaluate_expression(l->left.get(), env);
        if (l->op == "or") {
            if (to_bool(left)) return left;
        } else {
            if (!to_bool(left)) return left;
        }
        return evaluate_expression(l->right.get(), env);
    }

    if (auto b = dynamic_cast<BinaryExpressionNode*>(node)) {
        Value left = evaluate_expression(b->left.get(), env);
        Value right = evaluate_expression(b->right.get(), env);
        const std::string& op = b->op;
        const Token& tok = b->token;

        if (op == "+") {
            if (std::holds_alternative<double>(left) && std::holds_alternative<double>(right)) {
                return std::get<double>(left) + std::get<double>(right);
            }
            if (std::holds_alternative<std::string>(left) && std::holds_alternative<std::string>(right)) {
                return std::get<std::string>(left) + std::get<std::string>(right);
            }
            throw runtime_error(tok, "Operands must be two numbers or two strings.");
        }

        if (op == "==") return is_equal(left, right);
        if (op == "!=") return !is_equal(left, right);

        static const std::string numbers_msg = "Operands must be numbers.";
        if (!std::holds_alternative<double>(left) || !std::holds_alternative<double>(right)) {
            throw runtime_error(tok, numbers_msg);
        }
        double x = std::get<double>(left);
        double y = std::get<double>(right);

        // division by zero follows IEEE-754
        if (op == "-") return x - y;
        if (op == "*") return x * y;
        if (op == "/") return x / y;
        if (op == ">") return x > y;
        if (op == ">=") return x >= y;
        if (op == "<") return x < y;
        if (op == "<=") return x <= y;

        throw runtime_error(tok, "Unknown binary operator '" + op + "'.");
    }

    if (auto call = dynamic_cast<CallExpressionNode*>(node)) {
        Value callee = evaluate_expression(call->callee.get(), env);
        std::vector<Value> args;
        args.reserve(call->arguments.size());
        for (auto& arg : call->arguments) args.push_back(evaluate_expression(arg.get(), env));
        return call_value(callee, args, call->token);
    }

    if (auto mem = dynamic_cast<MemberExpressionNode*>(node)) {
        Value object = evaluate_expression(mem->object.get(), env);
        return get_property(object, mem->property, mem->token);
    }

    if (auto ma = dynamic_cast<MemberAssignmentNode*>(node)) {
        Value object = evaluate_expression(ma->object.get(), env);
        if (!std::holds_alternative<InstancePtr>(object)) {
            throw runtime_error(ma->token, "Only instances have fields.");
        }
        Value value = evaluate_expression(ma->value.get(), env);
        std::get<InstancePtr>(object)->fields[ma->property] = value;
        return value;
    }

    if (auto th = dynamic_cast<ThisExpressionNode*>(node)) {
        return lookup_variable(THIS_NAME, th, th->token, env);
    }

    // "this" lives one scope inside the "super" scope
    if (auto sup = dynamic_cast<SuperExpressionNode*>(node)) {
        auto it = locals.find(sup);
        if (it == locals.end()) {
            throw runtime_error(sup->token, "Can't use 'super' outside of a class.");
        }
        int distance = it->second;
        Value superclass = env->get_at(distance, SUPER_NAME, sup->token);
        Value object = env->get_at(distance - 1, THIS_NAME, sup->token);
        if (!std::holds_alternative<ClassPtr>(superclass) || !std::holds_alternative<InstancePtr>(object)) {
            throw runtime_error(sup->token, "Superclass must be a class.");
        }

        FunctionPtr method = std::get<ClassPtr>(superclass)->find_method(sup->method);
        if (!method) {
            throw runtime_error(sup->token, "Undefined property '" + sup->method + "'.");
        }
        return method->bind(std::get<InstancePtr>(object));
    }

    throw runtime_error(node->token, "Unsupported expression node.");
}

// src/evaluator/FunctionCall.cpp
#include "ClassRuntime.hpp"
#include "evaluator.hpp"
#include "lexical_scope.hpp"

namespace {
// Keeps the depth counter balanced when a call unwinds with an error.
struct CallDepthGuard {
    size_t& depth;
    explicit CallDepthGuard(size_t& d) : depth(d) { ++depth; }
    ~CallDepthGuard() { --depth; }
};
}  // namespace

FunctionPtr FunctionValue::bind(const InstancePtr& instance) const {
    auto env = std::make_shared<Environment>(closure);
    env->define(THIS_NAME, instance);
    auto bound = std::make_shared<FunctionValue>(declaration, env, is_initializer);
    bound->name = name;
    return bound;
}

size_t ClassValue::arity() const {
    FunctionPtr init = find_method(INITIALIZER_NAME);
    return init ? init->arity() : 0;
}

Value Evaluator::call_value(const Value& callee, const std::vector<Value>& args, const Token& callToken) {
    if (std::holds_alternative<FunctionPtr>(callee)) {
        FunctionPtr fn = std::get<FunctionPtr>(callee);
        if (args.size() != fn->arity()) {
            throw runtime_error(callToken,
                "Expected " + std::to_string(fn->arity()) + " arguments but got " + std::to_string(args.size()) + ".");
        }
        return call_function(fn, args, callToken);
    }

    if (std::holds_alternative<ClassPtr>(callee)) {
        ClassPtr klass = std::get<ClassPtr>(callee);
        if (args.size() != klass->arity()) {
            throw runtime_error(callToken,
                "Expected " + std::to_string(klass->arity()) + " arguments but got " + std::to_string(args.size()) + ".");
        }
        return instantiate(klass, args, callToken);
    }

    throw runtime_error(callToken, "Can only call functions and classes.");
}

Value Evaluator::call_function(FunctionPtr fn, const std::vector<Value>& args, const Token& callToken) {
    if (fn->is_native) {
        return fn->native_impl(args, callToken);
    }

    if (call_depth >= MAX_CALL_DEPTH) {
        throw runtime_error(callToken, "Stack overflow.");
    }
    CallDepthGuard guard(call_depth);

    // parameters and body share this one scope
    auto local = std::make_shared<Environment>(fn->closure);
    const auto& params = fn->declaration->parameters;
    for (size_t i = 0; i < params.size(); ++i) {
        local->define(params[i]->name, args[i]);
    }

    Value ret = std::monostate{};
    bool did_return = false;
    execute_block(fn->declaration->body, local, &ret, &did_return);

    // an initializer always yields its instance, even on a bare 'return;'
    if (fn->is_initializer) {
        return fn->closure->get_at(0, THIS_NAME, callToken);
    }
    return did_return ? ret : Value{std::monostate{}};
}

Value Evaluator::instantiate(ClassPtr klass, const std::vector<Value>& args, const Token& callToken) {
    auto instance = std::make_shared<InstanceValue>(klass);
    FunctionPtr init = klass->find_method(INITIALIZER_NAME);
    if (init) {
        call_function(init->bind(instance), args, callToken);
    }
    return instance;
}

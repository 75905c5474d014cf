//src/evaluator/Environment.cpp
#include "evaluator.hpp"

// ----------------- Environment methods -----------------

void Environment::define(const std::string& name, const Value& value) {
    values[name] = value;
}

Value Environment::get(const Token& name) const {
    auto it = values.find(name.value);
    if (it != values.end()) return it->second;
    if (parent) return parent->get(name);
    throw LuxError(ErrorKind::Runtime, "Undefined variable '" + name.value + "'.", name.loc);
}

// Assignment never creates a binding.
void Environment::assign(const Token& name, const Value& value) {
    auto it = values.find(name.value);
    if (it != values.end()) {
        it->second = value;
        return;
    }
    if (parent) {
        parent->assign(name, value);
        return;
    }
    throw LuxError(ErrorKind::Runtime, "Undefined variable '" + name.value + "'.", name.loc);
}

Environment* Environment::ancestor(int distance) {
    Environment* env = this;
    for (int i = 0; i < distance && env; ++i) env = env->parent.get();
    return env;
}

Value Environment::get_at(int distance, const std::string& name, const Token& where) {
    Environment* env = ancestor(distance);
    if (env) {
        auto it = env->values.find(name);
        if (it != env->values.end()) return it->second;
    }
    throw LuxError(ErrorKind::Runtime, "Undefined variable '" + name + "'.", where.loc);
}

void Environment::assign_at(int distance, const std::string& name, const Value& value, const Token& where) {
    Environment* env = ancestor(distance);
    if (!env) {
        throw LuxError(ErrorKind::Runtime, "Undefined variable '" + name + "'.", where.loc);
    }
    env->values[name] = value;
}

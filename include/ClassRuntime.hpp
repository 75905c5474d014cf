#pragma once
#include <memory>
#include <string>
#include <unordered_map>

#include "evaluator.hpp"

// A minimal runtime representation for classes
struct ClassValue {
    std::string name;
    ClassPtr super;  // parent class (if any)
    // method name -> function closed over the class scope
    std::unordered_map<std::string, FunctionPtr> methods;
    // token for diagnostics
    Token token;

    // own methods first, then up the superclass chain; null when absent
    FunctionPtr find_method(const std::string& method_name) const {
        auto it = methods.find(method_name);
        if (it != methods.end()) return it->second;
        if (super) return super->find_method(method_name);
        return nullptr;
    }

    // arity of "init", or zero without one
    size_t arity() const;
};

struct InstanceValue {
    ClassPtr klass;
    std::unordered_map<std::string, Value> fields;

    explicit InstanceValue(ClassPtr k) : klass(std::move(k)) {}
};

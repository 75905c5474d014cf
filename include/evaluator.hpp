#pragma once

#include <cstddef>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include "LuxError.hpp"
#include "ast.hpp"
#include "resolver.hpp"

class Environment;
using EnvPtr = std::shared_ptr<Environment>;

struct FunctionValue;
using FunctionPtr = std::shared_ptr<FunctionValue>;

struct ClassValue;
using ClassPtr = std::shared_ptr<ClassValue>;

struct InstanceValue;
using InstancePtr = std::shared_ptr<InstanceValue>;

// std::monostate is nil
using Value = std::variant<
    std::monostate,
    bool,
    double,
    std::string,
    FunctionPtr,
    ClassPtr,
    InstancePtr>;

using NativeFn = std::function<Value(const std::vector<Value>&, const Token&)>;

struct FunctionValue {
    std::string name;
    // not owned; the Session keeps every ProgramNode alive
    const FunctionDeclarationNode* declaration = nullptr;
    EnvPtr closure;
    bool is_initializer = false;

    bool is_native = false;
    size_t native_arity = 0;
    NativeFn native_impl;

    FunctionValue(const FunctionDeclarationNode* decl, const EnvPtr& env, bool initializer = false)
        : name(decl ? decl->name : ""),
          declaration(decl),
          closure(env),
          is_initializer(initializer) {}

    FunctionValue(const std::string& nm, size_t arity, NativeFn impl)
        : name(nm),
          is_native(true),
          native_arity(arity),
          native_impl(std::move(impl)) {}

    size_t arity() const {
        if (is_native) return native_arity;
        return declaration ? declaration->parameters.size() : 0;
    }

    // New function with the same declaration whose closure is a fresh scope
    // (child of this closure) binding "this" to the instance.
    FunctionPtr bind(const InstancePtr& instance) const;
};

class Environment : public std::enable_shared_from_this<Environment> {
   public:
    explicit Environment(EnvPtr parent = nullptr) : parent(parent) {}

    std::unordered_map<std::string, Value> values;
    EnvPtr parent;

    // define or redefine in this scope
    void define(const std::string& name, const Value& value);

    // walk the chain by name; used for globals
    Value get(const Token& name) const;
    void assign(const Token& name, const Value& value);

    // resolved access at a fixed number of hops
    Environment* ancestor(int distance);
    Value get_at(int distance, const std::string& name, const Token& where);
    void assign_at(int distance, const std::string& name, const Value& value, const Token& where);
};

class Evaluator {
   public:
    static constexpr size_t MAX_CALL_DEPTH = 1024;

    // A null globals environment gets a fresh one with the native functions.
    explicit Evaluator(EnvPtr globals = nullptr, std::ostream& out = std::cout);
    ~Evaluator();

    // Runs every statement of the program in the global environment.
    // Throws LuxError (Runtime) on the first runtime error.
    // The program must outlive every function value it creates.
    void evaluate(ProgramNode* program, const ResolutionTable& locals);

    // For REPL print on the go. Evaluated in the global environment.
    Value evaluate_expression(ExpressionNode* expr, const ResolutionTable& locals);

    std::string value_to_string(const Value& v) const;
    bool to_bool(const Value& v) const;
    bool is_equal(const Value& a, const Value& b) const;

    EnvPtr globals() const { return global_env; }

   private:
    EnvPtr global_env;
    std::ostream& out;
    // accumulates over every program run by this evaluator
    ResolutionTable locals;
    size_t call_depth = 0;

    void add_resolutions(const ResolutionTable& table);

    void evaluate_statement(StatementNode* node, EnvPtr env, Value* return_value, bool* did_return);
    void execute_block(const std::vector<std::unique_ptr<StatementNode>>& body, EnvPtr env, Value* return_value, bool* did_return);
    Value evaluate_expression(ExpressionNode* node, EnvPtr env);

    Value lookup_variable(const std::string& name, const ExpressionNode* expr, const Token& tok, EnvPtr env);
    Value call_value(const Value& callee, const std::vector<Value>& args, const Token& callToken);
    Value call_function(FunctionPtr fn, const std::vector<Value>& args, const Token& callToken);
    Value instantiate(ClassPtr klass, const std::vector<Value>& args, const Token& callToken);
    Value get_property(const Value& object, const std::string& name, const Token& tok);

    double to_number(const Value& v, const Token& tok, const std::string& message) const;
    LuxError runtime_error(const Token& tok, const std::string& message) const;
};

#pragma once
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "LuxError.hpp"
#include "ast.hpp"

// Scope distance for each resolved local reference, keyed by node identity.
// IdentifierNode, AssignmentExpressionNode, ThisExpressionNode and
// SuperExpressionNode are the only keys. Absent nodes are globals.
using ResolutionTable = std::unordered_map<const ExpressionNode*, int>;

class Resolver {
   public:
    Resolver() = default;

    // Walks the program once. Calling it again on the same tree yields an
    // identical table; errors() always reflects the latest call.
    ResolutionTable resolve(const ProgramNode* program);

    const std::vector<LuxError>& errors() const { return errors_; }
    bool had_error() const { return !errors_.empty(); }

   private:
    enum class FunctionKind {
        NONE,
        FUNCTION,
        INITIALIZER,
        METHOD
    };

    enum class ClassKind {
        NONE,
        CLASS,
        SUBCLASS
    };

    // innermost scope last; value is "initializer finished"
    std::vector<std::unordered_map<std::string, bool>> scopes;
    ResolutionTable locals;
    std::vector<LuxError> errors_;
    FunctionKind current_function = FunctionKind::NONE;
    ClassKind current_class = ClassKind::NONE;

    void resolve_statements(const std::vector<std::unique_ptr<StatementNode>>& body);
    void resolve_statement(const StatementNode* stmt);
    void resolve_expression(const ExpressionNode* expr);
    void resolve_function(const FunctionDeclarationNode* fn, FunctionKind kind);
    void resolve_local(const ExpressionNode* expr, const std::string& name);

    void begin_scope();
    void end_scope();
    void declare(const Token& name);
    void define(const std::string& name);

    void report(const Token& tok, const std::string& message);
};

#pragma once
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <limits>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "token.hpp"

// Shortest text that reads back as the same double; integral values print
// without a fractional part.
inline std::string format_number(double d) {
    if (std::isnan(d)) return "nan";
    if (std::isinf(d)) return d > 0 ? "inf" : "-inf";
    if (d == std::floor(d) && std::fabs(d) < 1e15) {
        if (d == 0 && std::signbit(d)) return "-0";
        return std::to_string(static_cast<long long>(d));
    }
    std::ostringstream ss;
    for (int precision = 15; precision <= 17; ++precision) {
        ss.str("");
        ss << std::setprecision(precision) << d;
        if (std::strtod(ss.str().c_str(), nullptr) == d) break;
    }
    return ss.str();
}

// Base class for all AST nodes
struct Node {
    virtual ~Node() = default;
    Token token;  // filename, line, column for this node (set by the parser)

    // Parenthesized prefix rendering, e.g. (* (- 123) (group 45.67)).
    virtual std::string to_string() const {
        return "<node>";
    }
};

// Expressions
struct ExpressionNode : public Node {
};

struct NumericLiteralNode : public ExpressionNode {
    double value = 0;
    std::string to_string() const override {
        return format_number(value);
    }
};

struct StringLiteralNode : public ExpressionNode {
    std::string value;
    std::string to_string() const override {
        return "\"" + value + "\"";
    }
};

struct BooleanLiteralNode : public ExpressionNode {
    bool value = false;
    std::string to_string() const override {
        return value ? "true" : "false";
    }
};

struct NilNode : public ExpressionNode {
    std::string to_string() const override {
        return "nil";
    }
};

struct GroupingNode : public ExpressionNode {
    std::unique_ptr<ExpressionNode> expression;
    std::string to_string() const override {
        return "(group " + (expression ? expression->to_string() : "<null>") + ")";
    }
};

// Variable reference. Resolved to a scope distance by the Resolver.
struct IdentifierNode : public ExpressionNode {
    std::string name;
    std::string to_string() const override {
        return name;
    }
};

struct UnaryExpressionNode : public ExpressionNode {
    std::string op;  // "!" or "-"
    std::unique_ptr<ExpressionNode> operand;
    std::string to_string() const override {
        std::string opnd = operand ? operand->to_string() : "<null>";
        return "(" + op + " " + opnd + ")";
    }
};

struct BinaryExpressionNode : public ExpressionNode {
    std::string op;  // e.g. "+", "*", "==", "<="
    std::unique_ptr<ExpressionNode> left;
    std::unique_ptr<ExpressionNode> right;
    std::string to_string() const override {
        std::string l = left ? left->to_string() : "<null>";
        std::string r = right ? right->to_string() : "<null>";
        return "(" + op + " " + l + " " + r + ")";
    }
};

// 'and' / 'or'. Kept apart from BinaryExpressionNode because the right side
// is evaluated only when the left side does not decide the result.
struct LogicalExpressionNode : public ExpressionNode {
    std::string op;  // "and" or "or"
    std::unique_ptr<ExpressionNode> left;
    std::unique_ptr<ExpressionNode> right;
    std::string to_string() const override {
        std::string l = left ? left->to_string() : "<null>";
        std::string r = right ? right->to_string() : "<null>";
        return "(" + op + " " + l + " " + r + ")";
    }
};

// name = value. Resolved to a scope distance like IdentifierNode.
struct AssignmentExpressionNode : public ExpressionNode {
    std::string name;
    std::unique_ptr<ExpressionNode> value;
    std::string to_string() const override {
        return "(= " + name + " " + (value ? value->to_string() : "<null>") + ")";
    }
};

struct CallExpressionNode : public ExpressionNode {
    // token is the closing parenthesis; runtime errors in the call report its line
    std::unique_ptr<ExpressionNode> callee;
    std::vector<std::unique_ptr<ExpressionNode>> arguments;

    std::string to_string() const override {
        std::string s = "(call " + (callee ? callee->to_string() : "<null>");
        for (const auto& a : arguments) {
            s += " " + (a ? a->to_string() : "<null>");
        }
        return s + ")";
    }
};

// Property read: obj.prop
struct MemberExpressionNode : public ExpressionNode {
    std::unique_ptr<ExpressionNode> object;
    std::string property;

    std::string to_string() const override {
        return "(. " + (object ? object->to_string() : "<null>") + " " + property + ")";
    }
};

// Property write: obj.prop = value
struct MemberAssignmentNode : public ExpressionNode {
    std::unique_ptr<ExpressionNode> object;
    std::string property;
    std::unique_ptr<ExpressionNode> value;

    std::string to_string() const override {
        return "(.= " + (object ? object->to_string() : "<null>") + " " + property + " " +
            (value ? value->to_string() : "<null>") + ")";
    }
};

struct ThisExpressionNode : public ExpressionNode {
    std::string to_string() const override {
        return "this";
    }
};

// super.method
struct SuperExpressionNode : public ExpressionNode {
    std::string method;

    std::string to_string() const override {
        return "(super " + method + ")";
    }
};

// Statements
struct StatementNode : public Node {
};

struct ExpressionStatementNode : public StatementNode {
    std::unique_ptr<ExpressionNode> expression;

    std::string to_string() const override {
        return "(; " + (expression ? expression->to_string() : "<null>") + ")";
    }
};

struct PrintStatementNode : public StatementNode {
    std::unique_ptr<ExpressionNode> expression;

    std::string to_string() const override {
        return "(print " + (expression ? expression->to_string() : "<null>") + ")";
    }
};

struct VariableDeclarationNode : public StatementNode {
    std::string identifier;
    std::unique_ptr<ExpressionNode> value;  // optional initializer

    std::string to_string() const override {
        if (!value) return "(var " + identifier + ")";
        return "(var " + identifier + " = " + value->to_string() + ")";
    }
};

// { ... } introduces a new lexical scope.
struct BlockStatementNode : public StatementNode {
    std::vector<std::unique_ptr<StatementNode>> body;

    std::string to_string() const override {
        std::string s = "(block";
        for (const auto& st : body) s += " " + (st ? st->to_string() : "<null>");
        return s + ")";
    }
};

// If statement
struct IfStatementNode : public StatementNode {
    std::unique_ptr<ExpressionNode> condition;
    std::unique_ptr<StatementNode> then_branch;
    std::unique_ptr<StatementNode> else_branch;  // optional

    std::string to_string() const override {
        std::string s = "(if " + (condition ? condition->to_string() : "<null>") + " " +
            (then_branch ? then_branch->to_string() : "<null>");
        if (else_branch) s += " " + else_branch->to_string();
        return s + ")";
    }
};

// While loop. 'for' loops are desugared into a block around one of these.
struct WhileStatementNode : public StatementNode {
    std::unique_ptr<ExpressionNode> condition;
    std::unique_ptr<StatementNode> body;

    std::string to_string() const override {
        return "(while " + (condition ? condition->to_string() : "<null>") + " " +
            (body ? body->to_string() : "<null>") + ")";
    }
};

struct ParameterNode : public Node {
    std::string name;

    std::string to_string() const override {
        return name;
    }
};

// Function declaration, also used for class methods.
struct FunctionDeclarationNode : public StatementNode {
    std::string name;
    std::vector<std::unique_ptr<ParameterNode>> parameters;
    std::vector<std::unique_ptr<StatementNode>> body;  // function body statements

    std::string to_string() const override {
        std::string s = "(fun " + name + " (";
        for (size_t i = 0; i < parameters.size(); ++i) {
            if (i) s += " ";
            s += parameters[i]->to_string();
        }
        s += ")";
        for (const auto& st : body) s += " " + (st ? st->to_string() : "<null>");
        return s + ")";
    }
};

struct ReturnStatementNode : public StatementNode {
    std::unique_ptr<ExpressionNode> value;  // optional

    std::string to_string() const override {
        if (!value) return "(return)";
        return "(return " + value->to_string() + ")";
    }
};

struct ClassDeclarationNode : public StatementNode {
    std::unique_ptr<IdentifierNode> name;
    std::unique_ptr<IdentifierNode> superClass;  // optional
    std::vector<std::unique_ptr<FunctionDeclarationNode>> methods;

    std::string to_string() const override {
        std::ostringstream ss;
        ss << "(class " << (name ? name->to_string() : "<anon>");
        if (superClass) ss << " < " << superClass->to_string();
        for (const auto& m : methods) ss << " " << m->to_string();
        ss << ")";
        return ss.str();
    }
};

// Program root
struct ProgramNode : public Node {
    std::vector<std::unique_ptr<StatementNode>> body;

    std::string to_string() const override {
        std::string s;
        for (const auto& st : body) {
            s += (st ? st->to_string() : "<null>") + "\n";
        }
        return s;
    }
};

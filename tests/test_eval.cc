#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "runner.hpp"

// Runs a whole program and keeps what it printed
class EvaluatorTestHelper {
   public:
    std::ostringstream out;
    RunResult result;

    std::string run(const std::string& source) {
        out.str("");
        result = run_source(source, "test.lux", out);
        return out.str();
    }

    std::string error_message() const {
        return result.errors.empty() ? "" : result.errors[0].message();
    }
};

// ============================================================================
// ARITHMETIC AND PRECEDENCE
// ============================================================================

TEST(EvaluatorTest, EvaluatesPrecedence) {
    EvaluatorTestHelper h;
    EXPECT_EQ(h.run("print 1 + 2 * 3; print (1 + 2) * 3;"), "7\n9\n");
    EXPECT_EQ(h.run("print -2 + 7; print -(2 + 3);"), "5\n-5\n");
    EXPECT_EQ(h.run("print 10 - 4 - 3;"), "3\n");
    EXPECT_EQ(h.run("print -1+2*3;"), "5\n");
    EXPECT_EQ(h.run("print 2-3-4;"), "-5\n");
}

TEST(EvaluatorTest, EvaluatesDivision) {
    EvaluatorTestHelper h;
    EXPECT_EQ(h.run("print 7 / 2;"), "3.5\n");
}

TEST(EvaluatorTest, DivisionByZeroFollowsIeee) {
    EvaluatorTestHelper h;
    EXPECT_EQ(h.run("print 1 / 0; print -1 / 0; print 0 / 0;"), "inf\n-inf\nnan\n");
    EXPECT_TRUE(h.result.ok());
}

TEST(EvaluatorTest, PrintsSubnormalNumbers) {
    EvaluatorTestHelper h;
    EXPECT_EQ(h.run("var x = 1; while (x / 2 > 0) x = x / 2; print x;"), "4.94065645841247e-324\n");
    EXPECT_TRUE(h.result.ok());
}

TEST(EvaluatorTest, PrintsHugeLiteralAsInfinity) {
    EvaluatorTestHelper h;
    EXPECT_EQ(h.run("print " + std::string(400, '9') + ";"), "inf\n");
    EXPECT_TRUE(h.result.ok());
}

TEST(EvaluatorTest, NumberFormatting) {
    EvaluatorTestHelper h;
    EXPECT_EQ(h.run("print 3; print 2.5; print -0; print 0.1 + 0.2;"), "3\n2.5\n-0\n0.30000000000000004\n");
}

// ============================================================================
// STRINGS, BOOLEANS, EQUALITY
// ============================================================================

TEST(EvaluatorTest, ConcatenatesStrings) {
    EvaluatorTestHelper h;
    EXPECT_EQ(h.run("print \"foo\" + \"bar\";"), "foobar\n");
}

TEST(EvaluatorTest, Truthiness) {
    EvaluatorTestHelper h;
    EXPECT_EQ(h.run("print !nil; print !false; print !0; print !\"\";"), "true\ntrue\nfalse\nfalse\n");
    EXPECT_EQ(h.run("if (0) print \"zero is truthy\";"), "zero is truthy\n");
}

TEST(EvaluatorTest, Equality) {
    EvaluatorTestHelper h;
    EXPECT_EQ(h.run("print nil == nil; print 1 == \"1\"; print \"a\" == \"a\"; print nil != false;"),
        "true\nfalse\ntrue\ntrue\n");
}

TEST(EvaluatorTest, Comparison) {
    EvaluatorTestHelper h;
    EXPECT_EQ(h.run("print 1 < 2; print 2 <= 2; print 3 > 4; print 4 >= 5;"), "true\ntrue\nfalse\nfalse\n");
}

TEST(EvaluatorTest, LogicalOperatorsReturnAnOperand) {
    EvaluatorTestHelper h;
    EXPECT_EQ(h.run("print nil or \"x\"; print 1 and 2; print \"a\" or 2;"), "x\n2\na\n");
}

TEST(EvaluatorTest, LogicalOperatorsShortCircuit) {
    EvaluatorTestHelper h;
    EXPECT_EQ(h.run("print false and missing; print true or missing;"), "false\ntrue\n");
    EXPECT_TRUE(h.result.ok());
    EXPECT_EQ(h.run("print false and (1/0);"), "false\n");
    EXPECT_TRUE(h.result.ok());
    EXPECT_EQ(h.run("print nil and (1 - \"x\"); print 1 or (1 - \"x\");"), "nil\n1\n");
    EXPECT_TRUE(h.result.ok());
}

// ============================================================================
// VARIABLES, SCOPES, CONTROL FLOW
// ============================================================================

TEST(EvaluatorTest, AssignmentYieldsValue) {
    EvaluatorTestHelper h;
    EXPECT_EQ(h.run("var a; print a; print a = 3; print a;"), "nil\n3\n3\n");
}

TEST(EvaluatorTest, BlocksShadowAndRestore) {
    EvaluatorTestHelper h;
    EXPECT_EQ(h.run("var a = \"outer\"; { var a = \"inner\"; print a; } print a;"), "inner\nouter\n");
}

TEST(EvaluatorTest, WhileAndForLoops) {
    EvaluatorTestHelper h;
    EXPECT_EQ(h.run("var i = 0; while (i < 3) { print i; i = i + 1; }"), "0\n1\n2\n");
    EXPECT_EQ(h.run("var sum = 0; for (var i = 1; i <= 4; i = i + 1) sum = sum + i; print sum;"), "10\n");
}

TEST(EvaluatorTest, ClosureBindingIsStatic) {
    EvaluatorTestHelper h;
    std::string src =
        "var a = \"global\";\n"
        "{\n"
        "  fun showA() { print a; }\n"
        "  showA();\n"
        "  var a = \"block\";\n"
        "  showA();\n"
        "}\n";
    EXPECT_EQ(h.run(src), "global\nglobal\n");
}

// ============================================================================
// FUNCTIONS AND CLOSURES
// ============================================================================

TEST(EvaluatorTest, RecursiveFunction) {
    EvaluatorTestHelper h;
    EXPECT_EQ(h.run("fun fib(n) { if (n < 2) return n; return fib(n - 1) + fib(n - 2); } print fib(10);"), "55\n");
}

TEST(EvaluatorTest, FunctionWithoutReturnYieldsNil) {
    EvaluatorTestHelper h;
    EXPECT_EQ(h.run("fun f() {} print f();"), "nil\n");
}

TEST(EvaluatorTest, ClosuresKeepTheirState) {
    EvaluatorTestHelper h;
    std::string src =
        "fun makeCounter() {\n"
        "  var i = 0;\n"
        "  fun count() { i = i + 1; return i; }\n"
        "  return count;\n"
        "}\n"
        "var c = makeCounter();\n"
        "print c(); print c(); print c();\n"
        "var d = makeCounter();\n"
        "print d();\n";
    EXPECT_EQ(h.run(src), "1\n2\n3\n1\n");
}

TEST(EvaluatorTest, ReturnUnwindsLoops) {
    EvaluatorTestHelper h;
    EXPECT_EQ(h.run("fun f() { while (true) { for (;;) { return \"out\"; } } } print f();"), "out\n");
}

TEST(EvaluatorTest, NativeClockReturnsNumber) {
    EvaluatorTestHelper h;
    EXPECT_EQ(h.run("var t = clock(); print t > 0; print clock() >= t;"), "true\ntrue\n");
}

// ============================================================================
// CLASSES
// ============================================================================

TEST(EvaluatorTest, PrintsCallablesAndInstances) {
    EvaluatorTestHelper h;
    EXPECT_EQ(h.run("fun f() {} print f; print clock; class K {} print K; print K();"),
        "<fn f>\n<native fn>\nK\nK instance\n");
}

TEST(EvaluatorTest, InitializerSetsFields) {
    EvaluatorTestHelper h;
    std::string src =
        "class Point {\n"
        "  init(x, y) { this.x = x; this.y = y; }\n"
        "  sum() { return this.x + this.y; }\n"
        "}\n"
        "var p = Point(2, 3);\n"
        "print p.sum();\n"
        "p.x = 10;\n"
        "print p.sum();\n";
    EXPECT_EQ(h.run(src), "5\n13\n");
}

TEST(EvaluatorTest, InitializerAlwaysReturnsInstance) {
    EvaluatorTestHelper h;
    EXPECT_EQ(h.run("class A { init() { this.x = 1; return; } } var a = A(); print a.init() == a; print a.x;"),
        "true\n1\n");
}

TEST(EvaluatorTest, BoundMethodsRememberThis) {
    EvaluatorTestHelper h;
    EXPECT_EQ(h.run("class C { init(n) { this.n = n; } get() { return this.n; } } var g = C(7).get; print g();"),
        "7\n");
}

TEST(EvaluatorTest, FieldsShadowMethods) {
    EvaluatorTestHelper h;
    EXPECT_EQ(h.run("class A { m() { return \"method\"; } } var a = A(); a.m = \"field\"; print a.m;"), "field\n");
}

TEST(EvaluatorTest, InheritanceAndSuper) {
    EvaluatorTestHelper h;
    std::string src =
        "class A { m() { return \"A\"; } only() { return \"inherited\"; } }\n"
        "class B < A { m() { return \"B\" + super.m(); } }\n"
        "class C < B { m() { return \"C\" + super.m(); } }\n"
        "print C().m();\n"
        "print C().only();\n";
    EXPECT_EQ(h.run(src), "CBA\ninherited\n");
}

TEST(EvaluatorTest, SubclassInheritsInitializerArity) {
    EvaluatorTestHelper h;
    EXPECT_EQ(h.run("class A { init(v) { this.v = v; } } class B < A {} print B(4).v;"), "4\n");
}

// ============================================================================
// RUNTIME ERRORS
// ============================================================================

struct RuntimeErrorCase {
    const char* source;
    const char* message;
};

class RuntimeErrorTest : public ::testing::TestWithParam<RuntimeErrorCase> {};

TEST_P(RuntimeErrorTest, ReportsMessage) {
    EvaluatorTestHelper h;
    h.run(GetParam().source);
    EXPECT_EQ(h.result.status, RunStatus::RuntimeError);
    EXPECT_EQ(h.result.exit_code(), 70);
    EXPECT_EQ(h.error_message(), GetParam().message);
    ASSERT_FALSE(h.result.errors.empty());
    EXPECT_EQ(h.result.errors[0].kind(), ErrorKind::Runtime);
}

INSTANTIATE_TEST_SUITE_P(Messages, RuntimeErrorTest,
    ::testing::Values(
        RuntimeErrorCase{"print -\"x\";", "Operand must be a number."},
        RuntimeErrorCase{"print 1 + \"a\";", "Operands must be two numbers or two strings."},
        RuntimeErrorCase{"print 1 < \"a\";", "Operands must be numbers."},
        RuntimeErrorCase{"print nothing;", "Undefined variable 'nothing'."},
        RuntimeErrorCase{"nothing = 1;", "Undefined variable 'nothing'."},
        RuntimeErrorCase{"\"x\"();", "Can only call functions and classes."},
        RuntimeErrorCase{"fun f(a) {} f(1, 2);", "Expected 1 arguments but got 2."},
        RuntimeErrorCase{"class A {} A(1);", "Expected 0 arguments but got 1."},
        RuntimeErrorCase{"var x = 1; print x.y;", "Only instances have properties."},
        RuntimeErrorCase{"var x = 1; x.y = 2;", "Only instances have fields."},
        RuntimeErrorCase{"class A {} print A().nope;", "Undefined property 'nope'."},
        RuntimeErrorCase{"var NotAClass = 1; class B < NotAClass {}", "Superclass must be a class."},
        RuntimeErrorCase{"fun r() { r(); } r();", "Stack overflow."}));

TEST(EvaluatorTest, RuntimeErrorCarriesLine) {
    EvaluatorTestHelper h;
    h.run("print 1;\nprint nil + 1;\nprint 2;");
    EXPECT_EQ(h.out.str(), "1\n");
    ASSERT_EQ(h.result.errors.size(), 1u);
    EXPECT_EQ(h.result.errors[0].line(), 2);
}

TEST(EvaluatorTest, StaticErrorsPreventExecution) {
    EvaluatorTestHelper h;
    EXPECT_EQ(h.run("print 1;\nprint ;"), "");
    EXPECT_EQ(h.result.status, RunStatus::StaticError);
    EXPECT_EQ(h.result.exit_code(), 65);
}

TEST(EvaluatorTest, ResolutionErrorsPreventExecution) {
    EvaluatorTestHelper h;
    EXPECT_EQ(h.run("print 1;\nreturn 2;"), "");
    EXPECT_EQ(h.result.status, RunStatus::StaticError);
    EXPECT_EQ(h.error_message(), "Can't return from top-level code.");
}

TEST(EvaluatorTest, LexicalAndSyntaxErrorsAreReportedTogether) {
    EvaluatorTestHelper h;
    h.run("var a = @;\nprint \"open;\n");
    EXPECT_EQ(h.result.status, RunStatus::StaticError);
    ASSERT_GE(h.result.errors.size(), 2u);
    EXPECT_EQ(h.result.errors[0].kind(), ErrorKind::Lexical);
    EXPECT_EQ(h.result.errors[1].kind(), ErrorKind::Lexical);
    EXPECT_EQ(h.result.errors.back().kind(), ErrorKind::Syntax);
}

TEST(EvaluatorTest, ErrorTextCarriesSourceTrace) {
    EvaluatorTestHelper h;
    h.run("var x = 1;\nprint x + nil;");
    ASSERT_EQ(h.result.errors.size(), 1u);
    std::string text = h.result.errors[0].what();
    EXPECT_NE(text.find("RuntimeError at test.lux:2:"), std::string::npos);
    EXPECT_NE(text.find(" * 2 | print x + nil;"), std::string::npos);
}

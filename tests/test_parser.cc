#include <gtest/gtest.h>

#include <string>

#include "lexer.hpp"
#include "parser.hpp"

struct ParseOutcome {
    std::unique_ptr<ProgramNode> program;
    std::vector<LuxError> errors;
};

static ParseOutcome parse_source(const std::string& source) {
    Lexer lexer(source, "test.lux");
    auto tokens = lexer.tokenize();
    Parser parser(tokens);
    ParseOutcome out;
    out.program = parser.parse();
    out.errors = parser.errors();
    return out;
}

// Renders the only statement of a clean parse.
static std::string render(const std::string& source) {
    auto out = parse_source(source);
    EXPECT_TRUE(out.errors.empty()) << (out.errors.empty() ? "" : out.errors[0].what());
    EXPECT_EQ(out.program->body.size(), 1u);
    if (out.program->body.empty()) return "";
    return out.program->body[0]->to_string();
}

TEST(ParserBasic, PrintsUnaryAndGrouping) {
    EXPECT_EQ(render("-123 * (45.67);"), "(; (* (- 123) (group 45.67)))");
}

TEST(ParserBasic, MultiplicationBindsTighterThanAddition) {
    EXPECT_EQ(render("1 + 2 * 3;"), "(; (+ 1 (* 2 3)))");
    EXPECT_EQ(render("1 - 2 - 3;"), "(; (- (- 1 2) 3))");
}

TEST(ParserBasic, ComparisonBindsTighterThanEquality) {
    EXPECT_EQ(render("1 < 2 == true;"), "(; (== (< 1 2) true))");
}

TEST(ParserBasic, AndBindsTighterThanOr) {
    EXPECT_EQ(render("a or b and c;"), "(; (or a (and b c)))");
}

TEST(ParserBasic, AssignmentIsRightAssociative) {
    EXPECT_EQ(render("a = b = 1;"), "(; (= a (= b 1)))");
}

TEST(ParserBasic, PropertyAssignment) {
    EXPECT_EQ(render("a.b.c = 1;"), "(; (.= (. a b) c 1))");
}

TEST(ParserBasic, ChainedCalls) {
    EXPECT_EQ(render("f(1)(2, nil);"), "(; (call (call f 1) 2 nil))");
}

TEST(ParserBasic, StringLiteralsAreQuoted) {
    EXPECT_EQ(render("print \"a\" + a;"), "(print (+ \"a\" a))");
}

TEST(ParserBasic, SuperMethodAccess) {
    EXPECT_EQ(render("super.cook;"), "(; (super cook))");
}

TEST(ParserBasic, VariableDeclarations) {
    EXPECT_EQ(render("var a;"), "(var a)");
    EXPECT_EQ(render("var a = \"x\";"), "(var a = \"x\")");
}

TEST(ParserBasic, ClassDeclaration) {
    EXPECT_EQ(render("class B < A { init(x) { this.x = x; } }"),
        "(class B < A (fun init (x) (; (.= this x x))))");
}

TEST(ParserBasic, ForLoopDesugarsToWhile) {
    EXPECT_EQ(render("for (var i = 0; i < 3; i = i + 1) print i;"),
        "(block (var i = 0) (while (< i 3) (block (print i) (; (= i (+ i 1))))))");
}

TEST(ParserBasic, ForLoopWithEmptyClauses) {
    EXPECT_EQ(render("for (;;) print 1;"), "(while true (print 1))");
}

TEST(ParserErrors, MissingSemicolonAtEnd) {
    auto out = parse_source("print 1");
    ASSERT_EQ(out.errors.size(), 1u);
    EXPECT_EQ(out.errors[0].message(), "Expect ';' after value.");
    EXPECT_EQ(out.errors[0].where(), "at end");
    EXPECT_EQ(out.errors[0].kind(), ErrorKind::Syntax);
}

TEST(ParserErrors, MissingCloseParen) {
    auto out = parse_source("print (1 + 2;");
    ASSERT_EQ(out.errors.size(), 1u);
    EXPECT_EQ(out.errors[0].message(), "Expect ')' after expression.");
    EXPECT_EQ(out.errors[0].where(), "at ';'");
}

TEST(ParserErrors, SynchronizesAndCollectsEveryError) {
    auto out = parse_source("var = 1;\nprint 2;\nvar y = ;\nprint 3;");
    ASSERT_EQ(out.errors.size(), 2u);
    EXPECT_EQ(out.errors[0].message(), "Expect variable name.");
    EXPECT_EQ(out.errors[0].line(), 1);
    EXPECT_EQ(out.errors[1].message(), "Expect expression.");
    EXPECT_EQ(out.errors[1].line(), 3);
    ASSERT_EQ(out.program->body.size(), 2u);
    EXPECT_EQ(out.program->body[0]->to_string(), "(print 2)");
    EXPECT_EQ(out.program->body[1]->to_string(), "(print 3)");
}

TEST(ParserErrors, InvalidAssignmentTargetIsReportedNotThrown) {
    auto out = parse_source("1 = 2; print 3;");
    ASSERT_EQ(out.errors.size(), 1u);
    EXPECT_EQ(out.errors[0].message(), "Invalid assignment target.");
    EXPECT_EQ(out.errors[0].where(), "at '='");
    EXPECT_EQ(out.program->body.size(), 2u);
}

static std::string numbered_list(size_t n, const std::string& prefix) {
    std::string s;
    for (size_t i = 0; i < n; ++i) {
        if (i) s += ", ";
        s += prefix + std::to_string(i);
    }
    return s;
}

TEST(ParserErrors, ArgumentLimit) {
    auto ok = parse_source("f(" + numbered_list(255, "a") + ");");
    EXPECT_TRUE(ok.errors.empty());

    auto bad = parse_source("f(" + numbered_list(256, "a") + ");");
    ASSERT_EQ(bad.errors.size(), 1u);
    EXPECT_EQ(bad.errors[0].message(), "Can't have more than 255 arguments.");
    EXPECT_EQ(bad.program->body.size(), 1u);
}

TEST(ParserErrors, ParameterLimit) {
    auto bad = parse_source("fun f(" + numbered_list(256, "p") + ") {}");
    ASSERT_EQ(bad.errors.size(), 1u);
    EXPECT_EQ(bad.errors[0].message(), "Can't have more than 255 parameters.");
}

TEST(ParserErrors, DeepGroupingWithinLimitParses) {
    auto out = parse_source("print " + std::string(200, '(') + "1" + std::string(200, ')') + ";");
    EXPECT_TRUE(out.errors.empty());
}

TEST(ParserErrors, ExpressionNestedTooDeeply) {
    auto out = parse_source("print " + std::string(300, '(') + "1" + std::string(300, ')') + ";");
    ASSERT_EQ(out.errors.size(), 1u);
    EXPECT_EQ(out.errors[0].message(), "Expression nested too deeply.");
    EXPECT_EQ(out.errors[0].kind(), ErrorKind::Syntax);
}

TEST(ParserErrors, DeepUnaryChainIsBounded) {
    auto out = parse_source("print " + std::string(5000, '-') + "1;");
    ASSERT_EQ(out.errors.size(), 1u);
    EXPECT_EQ(out.errors[0].message(), "Expression nested too deeply.");
}

TEST(ParserErrors, StatementNestedTooDeeply) {
    auto ok = parse_source(std::string(50, '{') + std::string(50, '}'));
    EXPECT_TRUE(ok.errors.empty());

    auto bad = parse_source(std::string(300, '{') + std::string(300, '}'));
    ASSERT_EQ(bad.errors.size(), 1u);
    EXPECT_EQ(bad.errors[0].message(), "Statement nested too deeply.");
}

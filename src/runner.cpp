// src/runner.cpp
#include "runner.hpp"

#include "colors.hpp"
#include "lexer.hpp"
#include "parser.hpp"
#include "resolver.hpp"

int RunResult::exit_code() const {
    switch (status) {
        case RunStatus::Ok:
            return 0;
        case RunStatus::StaticError:
            return 65;
        case RunStatus::RuntimeError:
            return 70;
    }
    return 70;
}

Session::Session(std::ostream& out, const std::string& filename)
    : out(out),
      filename(filename),
      evaluator_(nullptr, out) {}

RunResult Session::run(const std::string& source, bool echo) {
    RunResult result;
    result.source = std::make_shared<SourceManager>(filename, source);

    Lexer lexer(source, filename, result.source.get());
    std::vector<Token> tokens = lexer.tokenize();

    Parser parser(tokens);
    std::unique_ptr<ProgramNode> program = parser.parse();

    // scanner and parser errors are reported together
    for (const auto& e : lexer.errors()) result.errors.push_back(e);
    for (const auto& e : parser.errors()) result.errors.push_back(e);
    if (!result.errors.empty()) {
        result.status = RunStatus::StaticError;
        return result;
    }

    Resolver resolver;
    ResolutionTable locals = resolver.resolve(program.get());
    if (resolver.had_error()) {
        result.errors = resolver.errors();
        result.status = RunStatus::StaticError;
        return result;
    }

    ProgramNode* prog = program.get();
    programs.push_back(std::move(program));

    try {
        ExpressionStatementNode* single = nullptr;
        if (echo && prog->body.size() == 1) {
            single = dynamic_cast<ExpressionStatementNode*>(prog->body[0].get());
        }

        if (single) {
            Value v = evaluator_.evaluate_expression(single->expression.get(), locals);
            out << evaluator_.value_to_string(v) << "\n";
        } else {
            evaluator_.evaluate(prog, locals);
        }
    } catch (const LuxError& e) {
        result.errors.push_back(e);
        result.status = RunStatus::RuntimeError;
    }
    return result;
}

RunResult run_source(const std::string& source, const std::string& filename, std::ostream& out) {
    Session session(out, filename);
    return session.run(source);
}

void report_errors(const RunResult& result, std::ostream& err) {
    bool color = &err == &std::cerr && Color::supports_color(STDERR_FILENO);
    for (const auto& e : result.errors) {
        if (color) {
            const std::string& tint = e.is_static() ? Color::yellow : Color::bright_red;
            err << tint << e.what() << Color::reset << "\n";
        } else {
            err << e.what() << "\n";
        }
    }
}

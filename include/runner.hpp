#pragma once
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "LuxError.hpp"
#include "SourceManager.hpp"
#include "ast.hpp"
#include "evaluator.hpp"

enum class RunStatus {
    Ok,
    StaticError,   // scanner, parser or resolver reported; nothing ran
    RuntimeError   // execution stopped at the first runtime error
};

struct RunResult {
    RunStatus status = RunStatus::Ok;
    std::vector<LuxError> errors;
    // keeps the source alive for the traces inside errors
    std::shared_ptr<SourceManager> source;

    bool ok() const { return status == RunStatus::Ok; }

    // 0 on success, 65 for static errors, 70 for runtime errors
    int exit_code() const;
};

// Holds one global environment across many runs, so definitions from earlier
// inputs stay visible to later ones (the REPL and multi-part scripts).
class Session {
   public:
    explicit Session(std::ostream& out = std::cout, const std::string& filename = "<repl>");

    // Scans, parses, resolves and runs one chunk of source. When echo is set
    // and the chunk is a single expression statement, its value is written
    // to the output instead of being discarded.
    RunResult run(const std::string& source, bool echo = false);

    EnvPtr globals() const { return evaluator_.globals(); }
    Evaluator& evaluator() { return evaluator_; }

   private:
    std::ostream& out;
    std::string filename;
    Evaluator evaluator_;
    // function values point into these trees
    std::vector<std::unique_ptr<ProgramNode>> programs;
};

// One-shot run with a fresh Session.
RunResult run_source(const std::string& source, const std::string& filename = "<script>", std::ostream& out = std::cout);

// Writes each error, colored when err is a terminal.
void report_errors(const RunResult& result, std::ostream& err = std::cerr);

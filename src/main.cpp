#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "lexer.hpp"
#include "parser.hpp"
#include "print_debug.hpp"
#include "repl.hpp"
#include "runner.hpp"

namespace fs = std::filesystem;

namespace {
constexpr int EXIT_USAGE = 64;
constexpr int EXIT_NOINPUT = 66;

struct DumpOptions {
    bool tokens = false;
    bool ast = false;
};

void dump_source(const std::string& source, const std::string& filename, const DumpOptions& dump) {
    SourceManager src_mgr(filename, source);
    Lexer lexer(source, filename, &src_mgr);
    std::vector<Token> tokens = lexer.tokenize();
    if (dump.tokens) print_tokens(tokens, std::cerr);
    if (dump.ast) {
        Parser parser(tokens);
        std::unique_ptr<ProgramNode> ast = parser.parse();
        print_program_debug(ast.get(), std::cerr);
    }
}

int run_file_mode(const std::string& filename, const DumpOptions& dump) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Could not open file " << filename << std::endl;
        return EXIT_NOINPUT;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string source_code = buffer.str();

    if (dump.tokens || dump.ast) dump_source(source_code, filename, dump);

    RunResult result = run_source(source_code, filename, std::cout);
    std::cout.flush();
    report_errors(result, std::cerr);
    return result.exit_code();
}
}  // namespace

int main(int argc, char* argv[]) {
    auto print_usage = [](std::ostream& os) {
        os << "Usage: lux [options] [file]\n"
           << "Options:\n"
           << "  -v, --version    Print version and exit\n"
           << "  -i               Start REPL (interactive)\n"
           << "  -h, --help       Show this help message\n"
           << "  --dump-tokens    Print the token stream to stderr before running\n"
           << "  --dump-ast       Print the syntax tree to stderr before running\n"
           << "\n"
           << "If a filename starts with '-', either use `--` to end options\n"
           << "or prefix the filename with a path (for example `./-weird.lux`):\n"
           << "  lux -- -weird.lux\n";
    };

    // Simple options parser: scan argv until we hit a non-option or `--`.
    std::string potential;
    bool seen_double_dash = false;
    bool interactive = false;
    DumpOptions dump;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (seen_double_dash) {
            potential = arg;
            break;
        }

        if (arg == "--") {
            seen_double_dash = true;
            continue;
        }

        if (!arg.empty() && arg[0] == '-') {
            if (arg == "-v" || arg == "--version") {
                std::cout << "lux v" << LUX_VERSION << std::endl;
                return 0;
            } else if (arg == "-i") {
                interactive = true;
            } else if (arg == "-h" || arg == "--help") {
                print_usage(std::cout);
                return 0;
            } else if (arg == "--dump-tokens") {
                dump.tokens = true;
            } else if (arg == "--dump-ast") {
                dump.ast = true;
            } else {
                std::cerr << "lux: unknown option '" << arg << "'\n";
                std::cerr << "Try 'lux --help' for more information.\n";
                return EXIT_USAGE;
            }
            continue;
        }

        // First non-option argument is treated as filename
        potential = arg;
        if (i + 1 < argc) {
            std::cerr << "lux: too many arguments\n";
            print_usage(std::cerr);
            return EXIT_USAGE;
        }
        break;
    }

    if (interactive || potential.empty()) {
        run_repl_mode();
        return 0;
    }

    fs::path p(potential);
    if (!fs::exists(p) || fs::is_directory(p)) {
        std::cerr << "Error: File not found: " << p << std::endl;
        return EXIT_NOINPUT;
    }

    return run_file_mode(p.string(), dump);
}

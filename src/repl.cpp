#include "repl.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

#include "linenoise.h"
#include "repl_input.hpp"
#include "runner.hpp"

namespace fs = std::filesystem;

static std::optional<fs::path> get_home_dir() {
    const char* home = std::getenv("HOME");
    if (home && home[0] != '\0') return fs::path(home);
    return std::nullopt;
}

static fs::path history_file_in_home() {
    auto home = get_home_dir();
    if (home.has_value()) {
        return home.value() / ".lux_history";
    }
    return fs::current_path() / ".lux_history";
}

void run_repl_mode() {
    std::string buffer;
    Session session(std::cout, "<repl>");

    std::cout << "lux v" << LUX_VERSION << " | built on " << __DATE__ << "\n";
    std::cout << "Lux REPL: type 'exit' or 'quit' or Ctrl-D to quit\n";

    fs::path history_path = history_file_in_home();
    linenoiseHistoryLoad(history_path.string().c_str());
    std::string last_added_history;

    while (true) {
        std::string prompt = buffer.empty() ? ">>> " : "... ";
        char* raw = linenoise(prompt.c_str());
        if (!raw) {  // EOF (Ctrl-D) or error
            std::cout << "\n";
            break;
        }
        std::string line(raw);
        linenoiseFree(raw);

        if (buffer.empty() && is_exit_command(line)) break;

        if (!line.empty() && line != last_added_history) {
            linenoiseHistoryAdd(line.c_str());
            linenoiseHistorySave(history_path.string().c_str());
            last_added_history = line;
        }

        buffer += line;
        buffer.push_back('\n');

        // keep reading a multi-line block or call
        if (unclosed_brackets_depth(buffer) > 0) continue;

        RunResult result = session.run(buffer, true);
        std::cout.flush();
        report_errors(result, std::cerr);
        buffer.clear();
    }
}

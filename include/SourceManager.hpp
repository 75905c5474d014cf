#pragma once
#include <sstream>
#include <string>
#include <vector>

// Source text of one run, split into lines for error excerpts.
class SourceManager {
   public:
    std::string filename;
    std::string source;

    SourceManager(const std::string& fname, const std::string& src)
        : filename(fname), source(src) {
        split_lines();
    }

    // 1-based; empty for lines past the end
    std::string get_line(int line_num) const {
        if (line_num < 1 || static_cast<size_t>(line_num) > lines.size()) return "";
        return lines[line_num - 1];
    }

    // " * <line> | <text>" followed by a caret under column col
    std::string format_error_context(int line, int col) const {
        std::stringstream ss;
        std::string prefix = " * " + std::to_string(line) + " | ";
        ss << prefix << get_line(line) << "\n";
        ss << std::string(prefix.size() + (col > 0 ? col - 1 : 0), ' ') << "^";
        return ss.str();
    }

   private:
    std::vector<std::string> lines;

    // '\r' is dropped so CRLF files render like LF files
    void split_lines() {
        lines.emplace_back();
        for (char c : source) {
            if (c == '\n') {
                lines.emplace_back();
            } else if (c != '\r') {
                lines.back() += c;
            }
        }
        if (lines.size() > 1 && lines.back().empty()) lines.pop_back();
    }
};

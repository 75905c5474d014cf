#pragma once
#include <stdexcept>
#include <string>

#include "token.hpp"

enum class ErrorKind {
    Lexical,
    Syntax,
    Resolution,
    Runtime
};

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Lexical:
            return "LexicalError";
        case ErrorKind::Syntax:
            return "SyntaxError";
        case ErrorKind::Resolution:
            return "ResolutionError";
        case ErrorKind::Runtime:
            return "RuntimeError";
    }
    return "Error";
}

class LuxError : public std::runtime_error {
   public:
    LuxError(ErrorKind kind,
        const std::string& message,
        const TokenLocation& loc,
        const std::string& where = "") : std::runtime_error(format_message(kind, message, loc, where)),
                                         kind_(kind),
                                         message_(message),
                                         where_(where),
                                         loc_(loc) {}

    ErrorKind kind() const { return kind_; }
    const std::string& message() const { return message_; }
    // "at end" or "at '<lexeme>'" for syntax errors, empty otherwise.
    const std::string& where() const { return where_; }
    const TokenLocation& location() const { return loc_; }
    int line() const { return loc_.line; }

    bool is_static() const { return kind_ != ErrorKind::Runtime; }

   private:
    ErrorKind kind_;
    std::string message_;
    std::string where_;
    TokenLocation loc_;

    static std::string format_message(ErrorKind kind,
        const std::string& message,
        const TokenLocation& loc,
        const std::string& where) {
        std::string out = std::string(error_kind_name(kind)) + " at " + loc.to_string();
        if (!where.empty()) out += " (" + where + ")";
        out += "\n" + message;
        if (loc.src_mgr) {
            out += "\n --> Traced at:\n" + loc.get_line_trace();
        }
        return out;
    }
};

#include "print_debug.hpp"

#include <string>

static std::string escape(const std::string& s) {
    std::string out;
    for (char c : s) {
        if (c == '"' || c == '\\') out.push_back('\\');
        out.push_back(c);
    }
    return out;
}

static std::string literal_text(const Token& tok) {
    if (std::holds_alternative<double>(tok.literal)) return format_number(std::get<double>(tok.literal));
    if (std::holds_alternative<std::string>(tok.literal)) return "\"" + escape(std::get<std::string>(tok.literal)) + "\"";
    return "null";
}

void print_tokens(const std::vector<Token>& tokens, std::ostream& os) {
    for (size_t i = 0; i < tokens.size(); ++i) {
        const auto& tok = tokens[i];
        os << i << ": " << token_type_name(tok.type)
           << " '" << escape(tok.value) << "'"
           << " literal=" << literal_text(tok)
           << " at " << tok.loc.to_string() << "\n";
    }
}

void print_program_debug(const ProgramNode* ast, std::ostream& os) {
    if (!ast) {
        os << "(program)\n";
        return;
    }
    os << ast->to_string();
}

#pragma once

#include <string>
#include <vector>

#include "LuxError.hpp"
#include "token.hpp"

class Lexer {
   public:
    Lexer(const std::string& source, const std::string& filename = "", const SourceManager* mgr = nullptr);

    // Single left-to-right pass. Always ends with exactly one EOF_TOKEN, even
    // when errors were reported; check errors() afterwards.
    std::vector<Token> tokenize();

    const std::vector<LuxError>& errors() const { return errors_; }
    bool had_error() const { return !errors_.empty(); }

   private:
    const std::string src;
    const std::string filename;
    size_t i = 0;
    int line = 1;
    int col = 1;

    const SourceManager* src_mgr = nullptr;
    std::vector<LuxError> errors_;

    // helpers
    bool eof() const;
    char peek(size_t offset = 0) const;
    char peek_next() const;
    char advance();
    bool match(char expected);

    // Add token: optional explicit length (if -1, length is value.size()).
    void add_token(std::vector<Token>& out, TokenType type, const std::string& value, int tok_line, int tok_col, int tok_length = -1);
    void report(const std::string& message, int tok_line, int tok_col, int tok_length = 1);

    void scan_token(std::vector<Token>& out);
    void scan_number(std::vector<Token>& out, int tok_line, int tok_col, size_t start_index);
    void scan_identifier_or_keyword(std::vector<Token>& out, int tok_line, int tok_col, size_t start_index);
    void scan_string(std::vector<Token>& out, int tok_line, int tok_col, size_t start_index);

    void skip_line_comment();
};

#pragma once
#include <iostream>
#include <vector>

#include "ast.hpp"
#include "token.hpp"

// One line per token: index, kind, lexeme, literal, location.
void print_tokens(const std::vector<Token>& tokens, std::ostream& os = std::cout);

// One parenthesized form per top-level statement.
void print_program_debug(const ProgramNode* ast, std::ostream& os = std::cout);

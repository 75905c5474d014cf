#pragma once
#include <string>

// Count of unclosed '{' and '(' in s, ignoring string literals and
// line comments. Zero when balanced or when there are more closes than opens.
int unclosed_brackets_depth(const std::string& s);

// True for the lines that end an interactive session.
bool is_exit_command(const std::string& line);

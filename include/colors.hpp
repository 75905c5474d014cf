#pragma once

#include <unistd.h>  // for isatty(), STDERR_FILENO

#include <string>  // for std::string

namespace Color {
inline bool supports_color(int fd = STDERR_FILENO) {
    return isatty(fd);
}
const std::string reset = "\033[0m";

const std::string yellow = "\033[33m";  // lexical, syntax and resolution errors
const std::string bright_red = "\033[91m";  // runtime errors
}  // namespace Color

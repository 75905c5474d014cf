#pragma once

#include "evaluator.hpp"

// Defines the native functions (clock) in the given environment.
void init_globals(EnvPtr env);

#pragma once

// Interactive session on stdin/stdout with linenoise line editing.
void run_repl_mode();

// include/cli.hpp
#pragma once
#include <ostream>
#include <string>

#include "config.hpp"

// ucode_disasm entry point. The trace goes to `out`, diagnostics and usage
// to `err`. Returns the process exit code: 0 ok, 1 bad input or arguments,
// 2 internal error. `base` supplies the data directory.
int run_disasm(int argc, char** argv, std::ostream& out, std::ostream& err, const Config& base = Config{});

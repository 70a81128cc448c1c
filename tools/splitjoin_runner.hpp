#pragma once

#include <cstdio>

#include "splitjoin/message/source.hpp"

namespace splitjoin::tools {

// Runs the pipeline over `source`. Prints the result line to `out` and returns 0,
// or prints a diagnostic naming the failed step to `err` and returns 1.
int run_cli(message::source source, std::FILE * out, std::FILE * err);

}  // namespace splitjoin::tools

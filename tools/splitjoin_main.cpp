#include <cstdio>

#include "splitjoin/message/source.hpp"
#include "splitjoin_runner.hpp"

int main() {
  return splitjoin::tools::run_cli(splitjoin::message::fixed_source(), stdout, stderr);
}

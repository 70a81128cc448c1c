#include "splitjoin_runner.hpp"

#include <cstdint>
#include <string>

#include "splitjoin/pipeline/sm.hpp"
#include "splitjoin/splitjoin.h"

namespace splitjoin::tools {

namespace {

const char * phase_name(const pipeline::event::phase current) {
  using pipeline::event::phase;
  switch (current) {
    case phase::request:
      return "request";
    case phase::fetching_message:
      return "fetching message";
    case phase::splitting:
      return "splitting";
    case phase::joining:
      return "joining";
    case phase::capitalizing:
      return "capitalizing";
    case phase::none:
      break;
  }
  return "pipeline";
}

}  // namespace

int run_cli(const message::source source, std::FILE * out, std::FILE * err) {
  pipeline::sm runner{};
  std::string result;
  int32_t status = SPLITJOIN_OK;

  const bool ok = runner.process_event(pipeline::event::run{
    .source = source,
    .result_out = &result,
    .error_out = &status,
  });
  if (!ok) {
    std::fprintf(err, "splitjoin: %s failed: %s (status=%d)\n",
                 phase_name(runner.failed_phase()), splitjoin_status_string(status),
                 static_cast<int>(status));
    return 1;
  }

  std::fprintf(out, "%s\n", result.c_str());
  return 0;
}

}  // namespace splitjoin::tools

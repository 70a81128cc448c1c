#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "splitjoin/splitjoin.h"
#include "splitjoin/text/joiner/events.hpp"

namespace splitjoin::text::joiner::action {

struct context {
  const list::token_list * tokens = nullptr;
  std::string_view separator = event::k_default_separator;
  std::string * text_out = nullptr;
  size_t token_count = 0;
  int32_t last_error = SPLITJOIN_OK;
};

}  // namespace splitjoin::text::joiner::action

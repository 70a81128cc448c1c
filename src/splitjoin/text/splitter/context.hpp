#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "splitjoin/splitjoin.h"
#include "splitjoin/text/splitter/events.hpp"

namespace splitjoin::text::splitter::action {

struct context {
  std::string_view text = {};
  event::delimiter_policy policy = event::delimiter_policy::whitespace;
  list::token_list * tokens_out = nullptr;
  size_t token_count = 0;
  int32_t last_error = SPLITJOIN_OK;
};

}  // namespace splitjoin::text::splitter::action

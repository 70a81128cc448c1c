#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "splitjoin/list/token_list.hpp"
#include "splitjoin/pipeline/events.hpp"
#include "splitjoin/splitjoin.h"
#include "splitjoin/text/joiner/sm.hpp"
#include "splitjoin/text/splitter/sm.hpp"

namespace splitjoin::pipeline::action {

struct context {
  text::splitter::sm splitter;
  text::joiner::sm joiner;

  const event::run * request = nullptr;
  message::source source = {};
  text::splitter::event::delimiter_policy policy =
      text::splitter::event::delimiter_policy::whitespace;
  std::string_view separator = text::joiner::event::k_default_separator;
  std::string * result_out = nullptr;

  std::string_view message = {};
  list::token_list tokens = {};
  std::string joined = {};
  size_t token_count = 0;

  event::phase failed_phase = event::phase::none;
  int32_t phase_error = SPLITJOIN_OK;
  int32_t last_error = SPLITJOIN_OK;
};

}  // namespace splitjoin::pipeline::action

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "splitjoin/callback.hpp"
#include "splitjoin/message/source.hpp"
#include "splitjoin/text/joiner/events.hpp"
#include "splitjoin/text/splitter/events.hpp"

namespace splitjoin::pipeline::events {
struct run_done;
struct run_error;
}  // namespace splitjoin::pipeline::events

namespace splitjoin::pipeline::event {

enum class phase : uint8_t {
  none = 0,
  request = 1,
  fetching_message = 2,
  splitting = 3,
  joining = 4,
  capitalizing = 5,
};

struct run {
  message::source source = {};
  text::splitter::event::delimiter_policy policy =
      text::splitter::event::delimiter_policy::whitespace;
  std::string_view separator = text::joiner::event::k_default_separator;
  std::string * result_out = nullptr;
  int32_t * error_out = nullptr;

  splitjoin::callback<void(const events::run_done &)> on_done = {};
  splitjoin::callback<void(const events::run_error &)> on_error = {};
};

}  // namespace splitjoin::pipeline::event

namespace splitjoin::pipeline::events {

struct run_done {
  const event::run * request = nullptr;
  std::string_view text = {};
  size_t token_count = 0;
};

struct run_error {
  int32_t err = 0;
  event::phase phase = event::phase::none;
  const event::run * request = nullptr;
};

}  // namespace splitjoin::pipeline::events

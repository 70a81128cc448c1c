#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "splitjoin/callback.hpp"
#include "splitjoin/list/token_list.hpp"

namespace splitjoin::text::joiner::events {
struct joining_done;
struct joining_error;
}  // namespace splitjoin::text::joiner::events

namespace splitjoin::text::joiner::event {

inline constexpr std::string_view k_default_separator = " ";

struct join {
  const list::token_list * tokens = nullptr;
  std::string_view separator = k_default_separator;
  std::string * text_out = nullptr;
  int32_t * error_out = nullptr;

  splitjoin::callback<void(const events::joining_done &)> on_done = {};
  splitjoin::callback<void(const events::joining_error &)> on_error = {};
};

}  // namespace splitjoin::text::joiner::event

namespace splitjoin::text::joiner::events {

struct joining_done {
  const event::join * request = nullptr;
  std::string_view text = {};
  size_t token_count = 0;
};

struct joining_error {
  int32_t err = 0;
  const event::join * request = nullptr;
};

}  // namespace splitjoin::text::joiner::events

#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "splitjoin/callback.hpp"
#include "splitjoin/list/token_list.hpp"

namespace splitjoin::text::splitter::events {
struct splitting_done;
struct splitting_error;
}  // namespace splitjoin::text::splitter::events

namespace splitjoin::text::splitter::event {

enum class delimiter_policy : int32_t {
  whitespace = 0,
  space = 1,
};

struct split {
  std::string_view text = {};
  delimiter_policy policy = delimiter_policy::whitespace;
  list::token_list * tokens_out = nullptr;
  int32_t * error_out = nullptr;

  splitjoin::callback<void(const events::splitting_done &)> on_done = {};
  splitjoin::callback<void(const events::splitting_error &)> on_error = {};
};

}  // namespace splitjoin::text::splitter::event

namespace splitjoin::text::splitter::events {

struct splitting_done {
  const event::split * request = nullptr;
  size_t token_count = 0;
};

struct splitting_error {
  int32_t err = 0;
  const event::split * request = nullptr;
};

}  // namespace splitjoin::text::splitter::events

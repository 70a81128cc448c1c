#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

#include "splitjoin/splitjoin.h"
#include "splitjoin/text/joiner/context.hpp"
#include "splitjoin/text/joiner/events.hpp"

namespace splitjoin::text::joiner::action {

// Writes tokens into `out` with `separator` between neighbours. Returns tokens written.
// The result is assembled off to the side, so `separator` may view `out` itself.
inline size_t join_into(
    const list::token_list & tokens,
    const std::string_view separator,
    std::string & out) {
  size_t length = 0;
  for (const std::string & token : tokens) {
    length += token.size();
  }
  if (!tokens.empty()) {
    length += separator.size() * (tokens.size() - 1);
  }

  std::string joined;
  joined.reserve(length);
  size_t written = 0;
  for (const std::string & token : tokens) {
    if (written != 0) {
      joined.append(separator);
    }
    joined.append(token);
    written += 1;
  }
  out = std::move(joined);
  return written;
}

struct begin_join {
  void operator()(const event::join & ev, context & ctx) const noexcept {
    ctx.tokens = ev.tokens;
    ctx.separator = ev.separator;
    ctx.text_out = ev.text_out;
    ctx.token_count = 0;
    ctx.last_error = SPLITJOIN_OK;
    if (ev.error_out != nullptr) {
      *ev.error_out = SPLITJOIN_OK;
    }
  }
};

struct reject_invalid {
  void operator()(const event::join & ev, context & ctx) const noexcept {
    ctx.token_count = 0;
    ctx.last_error = SPLITJOIN_ERR_INVALID_ARGUMENT;
    if (ev.error_out != nullptr) {
      *ev.error_out = SPLITJOIN_ERR_INVALID_ARGUMENT;
    }
  }
};

struct run_join {
  void operator()(context & ctx) const {
    ctx.token_count = join_into(*ctx.tokens, ctx.separator, *ctx.text_out);
  }
};

struct on_unexpected {
  template <class event>
  void operator()(const event & ev, context & ctx) const noexcept {
    ctx.token_count = 0;
    ctx.last_error = SPLITJOIN_ERR_INVALID_ARGUMENT;
    if constexpr (requires { ev.error_out; }) {
      if (ev.error_out != nullptr) {
        *ev.error_out = SPLITJOIN_ERR_INVALID_ARGUMENT;
      }
    }
  }
};

inline constexpr begin_join begin_join{};
inline constexpr reject_invalid reject_invalid{};
inline constexpr run_join run_join{};
inline constexpr on_unexpected on_unexpected{};

}  // namespace splitjoin::text::joiner::action

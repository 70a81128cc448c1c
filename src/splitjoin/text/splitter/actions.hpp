#pragma once

#include <cstddef>
#include <string_view>

#include "splitjoin/splitjoin.h"
#include "splitjoin/text/splitter/context.hpp"
#include "splitjoin/text/splitter/events.hpp"

namespace splitjoin::text::splitter::action {

inline bool is_delimiter(const char c, const event::delimiter_policy policy) noexcept {
  if (policy == event::delimiter_policy::space) {
    return c == ' ';
  }
  switch (c) {
    case ' ':
    case '\t':
    case '\n':
    case '\v':
    case '\f':
    case '\r':
      return true;
    default:
      return false;
  }
}

// Appends every maximal run of non-delimiter characters to `out`. Returns tokens added.
inline size_t split_into(
    const std::string_view text,
    const event::delimiter_policy policy,
    list::token_list & out) {
  size_t added = 0;
  size_t pos = 0;
  while (pos < text.size()) {
    while (pos < text.size() && is_delimiter(text[pos], policy)) {
      ++pos;
    }
    const size_t start = pos;
    while (pos < text.size() && !is_delimiter(text[pos], policy)) {
      ++pos;
    }
    if (pos > start) {
      out.add(text.substr(start, pos - start));
      added += 1;
    }
  }
  return added;
}

// Captures the request into context and resets outputs.
inline constexpr auto begin_split = [](const event::split & ev, context & ctx) noexcept {
  ctx.text = ev.text;
  ctx.policy = ev.policy;
  ctx.tokens_out = ev.tokens_out;
  ctx.token_count = 0;
  ctx.last_error = SPLITJOIN_OK;
  if (ev.error_out != nullptr) {
    *ev.error_out = SPLITJOIN_OK;
  }
};

inline constexpr auto reject_invalid = [](const event::split & ev, context & ctx) noexcept {
  ctx.token_count = 0;
  ctx.last_error = SPLITJOIN_ERR_INVALID_ARGUMENT;
  if (ev.error_out != nullptr) {
    *ev.error_out = SPLITJOIN_ERR_INVALID_ARGUMENT;
  }
};

inline constexpr auto run_split = [](context & ctx) {
  ctx.tokens_out->clear();
  ctx.token_count = split_into(ctx.text, ctx.policy, *ctx.tokens_out);
};

inline constexpr auto on_unexpected = [](const auto & ev, context & ctx) noexcept {
  ctx.token_count = 0;
  ctx.last_error = SPLITJOIN_ERR_INVALID_ARGUMENT;
  if constexpr (requires { ev.error_out; }) {
    if (ev.error_out != nullptr) {
      *ev.error_out = SPLITJOIN_ERR_INVALID_ARGUMENT;
    }
  }
};

inline constexpr auto dispatch_done = [](const event::split & ev, const context & ctx) noexcept {
  if (!ev.on_done) {
    return;
  }
  ev.on_done(events::splitting_done{
    .request = &ev,
    .token_count = ctx.token_count,
  });
};

inline constexpr auto dispatch_error = [](const event::split & ev, const context & ctx) noexcept {
  if (!ev.on_error) {
    return;
  }
  ev.on_error(events::splitting_error{
    .err = ctx.last_error != SPLITJOIN_OK ? ctx.last_error : SPLITJOIN_ERR_BACKEND,
    .request = &ev,
  });
};

}  // namespace splitjoin::text::splitter::action

#pragma once

#include <cstdint>
#include <string_view>
#include <utility>

#include "splitjoin/pipeline/context.hpp"
#include "splitjoin/splitjoin.h"
#include "splitjoin/text/capitalize.hpp"

namespace splitjoin::pipeline::action {

inline void set_error(context & ctx, const int32_t err, const event::phase phase) noexcept {
  ctx.phase_error = err;
  ctx.last_error = err;
  ctx.failed_phase = phase;
}

inline void clear_request(context & ctx) noexcept {
  ctx.request = nullptr;
  ctx.source = {};
  ctx.result_out = nullptr;
  ctx.message = {};
}

struct begin_run {
  void operator()(const event::run & ev, context & ctx) const noexcept {
    if (ev.error_out != nullptr) {
      *ev.error_out = SPLITJOIN_OK;
    }
    ctx.request = &ev;
    ctx.source = ev.source;
    ctx.policy = ev.policy;
    ctx.separator = ev.separator;
    ctx.result_out = ev.result_out;
    ctx.message = {};
    ctx.tokens.clear();
    ctx.joined.clear();
    ctx.token_count = 0;
    ctx.failed_phase = event::phase::none;
    ctx.phase_error = SPLITJOIN_OK;
    ctx.last_error = SPLITJOIN_OK;
  }
};

struct reject_invalid {
  void operator()(const event::run &, context & ctx) const noexcept {
    ctx.token_count = 0;
    set_error(ctx, SPLITJOIN_ERR_INVALID_ARGUMENT, event::phase::request);
  }
};

struct fetch_message {
  void operator()(context & ctx) const noexcept {
    ctx.phase_error = SPLITJOIN_OK;
    std::string_view text = {};
    int32_t err = SPLITJOIN_OK;
    if (!ctx.source(&text, &err)) {
      set_error(ctx, err != SPLITJOIN_OK ? err : SPLITJOIN_ERR_SOURCE,
                event::phase::fetching_message);
      return;
    }
    ctx.message = text;
  }
};

struct run_split {
  void operator()(context & ctx) const {
    ctx.phase_error = SPLITJOIN_OK;
    int32_t err = SPLITJOIN_OK;
    const bool ok = ctx.splitter.process_event(text::splitter::event::split{
        .text = ctx.message,
        .policy = ctx.policy,
        .tokens_out = &ctx.tokens,
        .error_out = &err,
    });
    if (!ok) {
      set_error(ctx, err != SPLITJOIN_OK ? err : SPLITJOIN_ERR_BACKEND,
                event::phase::splitting);
      return;
    }
    ctx.token_count = ctx.tokens.size();
  }
};

struct run_join {
  void operator()(context & ctx) const {
    ctx.phase_error = SPLITJOIN_OK;
    int32_t err = SPLITJOIN_OK;
    const bool ok = ctx.joiner.process_event(text::joiner::event::join{
        .tokens = &ctx.tokens,
        .separator = ctx.separator,
        .text_out = &ctx.joined,
        .error_out = &err,
    });
    if (!ok) {
      set_error(ctx, err != SPLITJOIN_OK ? err : SPLITJOIN_ERR_BACKEND,
                event::phase::joining);
      return;
    }
    // tokens are consumed by the join.
    ctx.tokens.clear();
  }
};

struct run_capitalize {
  void operator()(context & ctx) const noexcept {
    ctx.phase_error = SPLITJOIN_OK;
    text::capitalize_in_place(ctx.joined);
  }
};

struct publish {
  void operator()(context & ctx) const noexcept {
    *ctx.result_out = std::move(ctx.joined);
    ctx.joined.clear();
    ctx.last_error = SPLITJOIN_OK;
  }
};

struct ensure_last_error {
  void operator()(context & ctx) const noexcept {
    if (ctx.last_error != SPLITJOIN_OK) {
      return;
    }
    ctx.last_error = ctx.phase_error == SPLITJOIN_OK ? SPLITJOIN_ERR_BACKEND : ctx.phase_error;
  }
};

struct on_unexpected {
  template <class event_type>
  void operator()(const event_type &, context & ctx) const noexcept {
    ctx.token_count = 0;
    set_error(ctx, SPLITJOIN_ERR_INVALID_ARGUMENT, event::phase::none);
  }
};

inline constexpr begin_run begin_run{};
inline constexpr reject_invalid reject_invalid{};
inline constexpr fetch_message fetch_message{};
inline constexpr run_split run_split{};
inline constexpr run_join run_join{};
inline constexpr run_capitalize run_capitalize{};
inline constexpr publish publish{};
inline constexpr ensure_last_error ensure_last_error{};
inline constexpr on_unexpected on_unexpected{};

}  // namespace splitjoin::pipeline::action

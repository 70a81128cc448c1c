#pragma once

#include "splitjoin/pipeline/context.hpp"
#include "splitjoin/pipeline/events.hpp"

namespace splitjoin::pipeline::guard {

struct valid_request {
  bool operator()(const event::run & ev) const noexcept {
    return static_cast<bool>(ev.source) && ev.result_out != nullptr;
  }
};

struct invalid_request {
  bool operator()(const event::run & ev) const noexcept { return !valid_request{}(ev); }
};

struct phase_ok {
  bool operator()(const action::context & ctx) const noexcept {
    return ctx.phase_error == SPLITJOIN_OK;
  }
};

struct phase_failed {
  bool operator()(const action::context & ctx) const noexcept {
    return ctx.phase_error != SPLITJOIN_OK;
  }
};

}  // namespace splitjoin::pipeline::guard

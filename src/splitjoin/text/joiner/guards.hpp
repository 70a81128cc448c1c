#pragma once

#include "splitjoin/text/joiner/context.hpp"
#include "splitjoin/text/joiner/events.hpp"

namespace splitjoin::text::joiner::guard {

struct valid_request {
  bool operator()(const event::join & ev) const noexcept {
    return ev.tokens != nullptr && ev.text_out != nullptr;
  }
};

struct invalid_request {
  bool operator()(const event::join & ev) const noexcept { return !valid_request{}(ev); }
};

}  // namespace splitjoin::text::joiner::guard

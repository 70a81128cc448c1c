#pragma once

#include "splitjoin/text/splitter/context.hpp"
#include "splitjoin/text/splitter/events.hpp"

namespace splitjoin::text::splitter::guard {

inline constexpr auto policy_is_known = [](const event::delimiter_policy policy) noexcept {
  switch (policy) {
    case event::delimiter_policy::whitespace:
    case event::delimiter_policy::space:
      return true;
  }
  return false;
};

// validates output pointer and delimiter policy on the triggering event.
inline constexpr auto request_is_valid = [](const event::split & ev) noexcept {
  return ev.tokens_out != nullptr && policy_is_known(ev.policy);
};

inline constexpr auto request_is_invalid =
    [](const event::split & ev) noexcept { return !request_is_valid(ev); };

}  // namespace splitjoin::text::splitter::guard

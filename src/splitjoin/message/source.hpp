#pragma once

#include <cstdint>
#include <string_view>

#include "splitjoin/callback.hpp"
#include "splitjoin/splitjoin.h"

namespace splitjoin::message {

inline constexpr std::string_view k_default_message = "Hello      World!";

// Writes the message into `text_out` and returns true, or writes a status into
// `error_out` and returns false. Either out pointer may be null.
using source = splitjoin::callback<bool(std::string_view * text_out, int32_t * error_out)>;

namespace detail {

inline bool read_default_message(std::string_view * text_out, int32_t * error_out) noexcept {
  if (text_out == nullptr) {
    if (error_out != nullptr) {
      *error_out = SPLITJOIN_ERR_INVALID_ARGUMENT;
    }
    return false;
  }
  *text_out = k_default_message;
  if (error_out != nullptr) {
    *error_out = SPLITJOIN_OK;
  }
  return true;
}

}  // namespace detail

inline constexpr source fixed_source() noexcept {
  return source::from<&detail::read_default_message>();
}

}  // namespace splitjoin::message

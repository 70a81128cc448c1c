#include "splitjoin/splitjoin.h"

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>

#include "splitjoin/message/source.hpp"
#include "splitjoin/pipeline/sm.hpp"

namespace {

constexpr char k_default_message_cstr[] = "Hello      World!";
static_assert(std::string_view(k_default_message_cstr) == splitjoin::message::k_default_message);

splitjoin_status normalize_status(const bool ok, const int32_t err) noexcept {
  if (ok && err == SPLITJOIN_OK) {
    return SPLITJOIN_OK;
  }
  if (err == SPLITJOIN_OK) {
    return SPLITJOIN_ERR_BACKEND;  // GCOVR_EXCL_LINE
  }
  return static_cast<splitjoin_status>(err);
}

// Message source over the caller's buffer.
struct caller_text {
  std::string_view text = {};

  bool read(std::string_view * text_out, int32_t * error_out) const noexcept {
    if (text_out == nullptr) {
      if (error_out != nullptr) {
        *error_out = SPLITJOIN_ERR_INVALID_ARGUMENT;
      }
      return false;
    }
    *text_out = text;
    return true;
  }
};

}  // namespace

extern "C" {

const char * splitjoin_status_string(const int32_t status) {
  switch (status) {
    case SPLITJOIN_OK:
      return "ok";
    case SPLITJOIN_ERR_INVALID_ARGUMENT:
      return "invalid argument";
    case SPLITJOIN_ERR_SOURCE:
      return "message source failed";
    case SPLITJOIN_ERR_CAPACITY:
      return "output buffer too small";
    case SPLITJOIN_ERR_BACKEND:
      return "internal error";
    default:
      return "unknown status";
  }
}

const char * splitjoin_default_message(void) {
  return k_default_message_cstr;
}

splitjoin_status splitjoin_transform(
    const char * text,
    const size_t text_len,
    char * out,
    const size_t out_capacity,
    size_t * out_len) {
  if (out_len != nullptr) {
    *out_len = 0;
  }
  if (text == nullptr && text_len != 0) {
    return SPLITJOIN_ERR_INVALID_ARGUMENT;
  }
  if (out == nullptr && out_capacity != 0) {
    return SPLITJOIN_ERR_INVALID_ARGUMENT;
  }

  caller_text input{
    .text = text_len == 0 ? std::string_view{} : std::string_view(text, text_len),
  };
  std::string joined;
  int32_t err = SPLITJOIN_OK;
  splitjoin::pipeline::sm pipeline;
  const bool ok = pipeline.process_event(splitjoin::pipeline::event::run{
    .source = splitjoin::message::source::from<caller_text, &caller_text::read>(&input),
    .policy = splitjoin::text::splitter::event::delimiter_policy::whitespace,
    .result_out = &joined,
    .error_out = &err,
  });
  if (!ok || err != SPLITJOIN_OK) {
    return normalize_status(ok, err);
  }

  if (out_len != nullptr) {
    *out_len = joined.size();
  }
  if (out_capacity < joined.size() + 1) {
    return SPLITJOIN_ERR_CAPACITY;
  }
  if (!joined.empty()) {
    std::memcpy(out, joined.data(), joined.size());
  }
  out[joined.size()] = '\0';
  return SPLITJOIN_OK;
}

}  // extern "C"

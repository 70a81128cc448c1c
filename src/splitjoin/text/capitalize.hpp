#pragma once

#include <cctype>
#include <string>
#include <string_view>

namespace splitjoin::text {

// Uppercases the first byte with C-locale toupper semantics; the rest is untouched.
// A multi-byte UTF-8 lead byte has no mapping, so such text comes back as-is.
inline void capitalize_in_place(std::string & text) noexcept {
  if (text.empty()) {
    return;
  }
  text[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(text[0])));
}

inline std::string capitalize(const std::string_view text) {
  std::string out(text);
  capitalize_in_place(out);
  return out;
}

}  // namespace splitjoin::text

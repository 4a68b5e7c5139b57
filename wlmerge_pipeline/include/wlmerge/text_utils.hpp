#pragma once

#include <cstddef>
#include <string_view>

namespace wlmerge {

inline bool IsAsciiSpace(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' ||
         c == '\v';
}

// Strip leading/trailing ASCII whitespace. Non-ASCII bytes (including the
// UTF-8 encoding of U+00A0) are kept as line content.
inline std::string_view TrimAscii(std::string_view s) {
  std::size_t b = 0;
  std::size_t e = s.size();
  while (b < e && IsAsciiSpace(s[b])) ++b;
  while (e > b && IsAsciiSpace(s[e - 1])) --e;
  return s.substr(b, e - b);
}

}  // namespace wlmerge

#pragma once

#include <cstddef>
#include <string_view>

namespace triemux {

// ASCII-only lower case conversion, other bytes are returned unchanged.
constexpr char ToLowerAscii(char ch) {
  return ch >= 'A' && ch <= 'Z' ? static_cast<char>(ch + ('a' - 'A')) : ch;
}

// ASCII case-insensitive comparison, used for HTTP tokens such as methods and header names.
constexpr bool CaseInsensitiveEqual(std::string_view lhs, std::string_view rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  for (std::size_t pos = 0; pos < lhs.size(); ++pos) {
    if (ToLowerAscii(lhs[pos]) != ToLowerAscii(rhs[pos])) {
      return false;
    }
  }
  return true;
}

}  // namespace triemux

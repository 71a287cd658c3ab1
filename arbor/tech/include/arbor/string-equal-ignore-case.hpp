#pragma once

#include <cstddef>
#include <string_view>

namespace arbor {

// ASCII only, header field names are tokens (RFC 9110 5.1).
constexpr char AsciiToLower(char ch) noexcept { return ch >= 'A' && ch <= 'Z' ? static_cast<char>(ch | 0x20) : ch; }

constexpr bool CaseInsensitiveEqual(std::string_view lhs, std::string_view rhs) noexcept {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  for (std::size_t pos = 0; pos < lhs.size(); ++pos) {
    if (AsciiToLower(lhs[pos]) != AsciiToLower(rhs[pos])) {
      return false;
    }
  }
  return true;
}

}  // namespace arbor

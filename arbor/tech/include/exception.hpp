#pragma once

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <exception>
#include <utility>

namespace arbor {

// Base exception of arbor, holding its message in an inline buffer (no dynamic allocation).
// Formatted messages longer than kMsgMaxLen are truncated and end with "...".
class exception : public std::exception {
 public:
  static constexpr std::size_t kMsgMaxLen = 111;

  template <unsigned N>
  explicit exception(const char (&str)[N]) noexcept
    requires(N <= kMsgMaxLen + 1)
  {
    std::memcpy(_msg, str, N);
  }

  template <typename... Args>
  explicit exception(fmt::format_string<Args...> fmtStr, Args&&... args) {
    const auto res = fmt::format_to_n(_msg, kMsgMaxLen, fmtStr, std::forward<Args>(args)...);
    if (res.size > kMsgMaxLen) {
      std::fill(_msg + kMsgMaxLen - 3U, _msg + kMsgMaxLen, '.');
      _msg[kMsgMaxLen] = '\0';
    } else {
      *res.out = '\0';
    }
  }

  [[nodiscard]] const char* what() const noexcept override { return _msg; }

 private:
  char _msg[kMsgMaxLen + 1];
};

}  // namespace arbor

#pragma once

#include <bit>
#include <cstdint>
#include <optional>
#include <string_view>
#include <type_traits>

namespace arbor::http {

enum class Method : uint16_t {
  GET = 1 << 0,
  HEAD = 1 << 1,
  POST = 1 << 2,
  PUT = 1 << 3,
  DELETE = 1 << 4,
  CONNECT = 1 << 5,
  OPTIONS = 1 << 6,
  TRACE = 1 << 7,
  PATCH = 1 << 8
};

using MethodIdx = std::underlying_type_t<Method>;
inline constexpr MethodIdx kNbMethods = 9;

using MethodBmp = uint16_t;

inline constexpr MethodBmp kAllMethods = static_cast<MethodBmp>((1U << kNbMethods) - 1U);

constexpr MethodBmp operator|(Method lhs, Method rhs) noexcept {
  using T = std::underlying_type_t<Method>;
  return static_cast<MethodBmp>(static_cast<T>(lhs) | static_cast<T>(rhs));
}

constexpr MethodBmp operator|(MethodBmp lhs, Method rhs) noexcept {
  using T = std::underlying_type_t<Method>;
  return static_cast<MethodBmp>(static_cast<T>(lhs) | static_cast<T>(rhs));
}

static_assert(kNbMethods <= sizeof(MethodBmp) * 8,
              "MethodBmp type too small to hold all methods; increase size or change type");

constexpr bool IsMethodSet(MethodBmp mask, Method method) { return (mask & static_cast<MethodBmp>(method)) != 0U; }

constexpr bool IsMethodSet(MethodBmp mask, MethodIdx methodIdx) {
  return (mask & (1U << static_cast<MethodBmp>(methodIdx))) != 0U;
}

constexpr MethodIdx MethodToIdx(Method method) {
  return static_cast<MethodIdx>(std::countr_zero(static_cast<MethodIdx>(method)));
}

constexpr Method MethodFromIdx(MethodIdx methodIdx) { return static_cast<http::Method>(1U << methodIdx); }

inline constexpr std::string_view kMethodStrings[] = {"GET",     "HEAD",    "POST",  "PUT",  "DELETE",
                                                      "CONNECT", "OPTIONS", "TRACE", "PATCH"};

constexpr std::string_view MethodToStr(Method method) { return kMethodStrings[MethodToIdx(method)]; }

// Method tokens are case-sensitive (RFC 9110 9.1).
constexpr std::optional<Method> MethodFromStr(std::string_view token) {
  for (MethodIdx methodIdx = 0; methodIdx < kNbMethods; ++methodIdx) {
    if (kMethodStrings[methodIdx] == token) {
      return MethodFromIdx(methodIdx);
    }
  }
  return std::nullopt;
}

// Methods for which a trailing slash redirect keeps the permanent (301) status.
// Other methods get a 307 so that clients replay them with the same method and body.
constexpr bool IsPermanentRedirectSafe(Method method) { return method == Method::GET || method == Method::HEAD; }

}  // namespace arbor::http

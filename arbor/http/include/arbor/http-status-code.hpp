#pragma once

#include <cstdint>

namespace arbor::http {

using StatusCode = int16_t;

inline constexpr StatusCode StatusCodeOK = 200;
inline constexpr StatusCode StatusCodeCreated = 201;
inline constexpr StatusCode StatusCodeNoContent = 204;

inline constexpr StatusCode StatusCodeMovedPermanently = 301;
inline constexpr StatusCode StatusCodeTemporaryRedirect = 307;

inline constexpr StatusCode StatusCodeNotFound = 404;

inline constexpr StatusCode StatusCodeInternalServerError = 500;

}  // namespace arbor::http

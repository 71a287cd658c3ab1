#pragma once

#include <string_view>

#include "arbor/http-status-code.hpp"

namespace arbor::http {

// Header names in their canonical form for emission.
inline constexpr std::string_view ContentType = "Content-Type";
inline constexpr std::string_view Location = "Location";

// Reason Phrases of the status codes the router emits (200, 301, 307, 404, 500) and of the
// common success codes handlers build responses with (201, 204)
inline constexpr std::string_view ReasonOK = "OK";                                    // 200
inline constexpr std::string_view ReasonCreated = "Created";                          // 201
inline constexpr std::string_view ReasonNoContent = "No Content";                     // 204
inline constexpr std::string_view MovedPermanently = "Moved Permanently";             // 301
inline constexpr std::string_view TemporaryRedirect = "Temporary Redirect";           // 307
inline constexpr std::string_view NotFound = "Not Found";                             // 404
inline constexpr std::string_view ReasonInternalServerError = "Internal Server Error";  // 500

inline constexpr std::string_view ContentTypeTextPlain = "text/plain";

// Return the canonical reason phrase for a subset of status codes we care about.
constexpr std::string_view ReasonPhraseFor(http::StatusCode status) noexcept {
  switch (status) {
    case StatusCodeOK:
      return ReasonOK;
    case StatusCodeCreated:
      return ReasonCreated;
    case StatusCodeNoContent:
      return ReasonNoContent;
    case StatusCodeMovedPermanently:
      return MovedPermanently;
    case StatusCodeTemporaryRedirect:
      return TemporaryRedirect;
    case StatusCodeNotFound:
      return NotFound;
    case StatusCodeInternalServerError:
      return ReasonInternalServerError;
    default:
      return {};
  }
}

}  // namespace arbor::http

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "arbor/http-constants.hpp"
#include "arbor/http-status-code.hpp"
#include "arbor/vector.hpp"

namespace arbor {

// Response produced by a handler or by the router itself (redirects, not found).
// Serialization on the wire is the transport's business.
class HttpResponse {
 public:
  struct Header {
    std::string name;
    std::string value;
  };

  // Constructs an HttpResponse with the given status code and reason phrase.
  // If reason is empty, the canonical reason phrase of the status code is used when known.
  explicit HttpResponse(http::StatusCode code = http::StatusCodeOK, std::string_view reason = {});

  // Constructs a 200 HttpResponse with the given body.
  // The content type defaults to "text/plain"
  explicit HttpResponse(std::string_view body, std::string_view contentType = http::ContentTypeTextPlain);

  [[nodiscard]] http::StatusCode status() const noexcept { return _status; }

  [[nodiscard]] std::string_view reason() const noexcept { return _reason; }

  [[nodiscard]] std::string_view body() const noexcept { return _body; }

  // Retrieves the value of the given header key (case-insensitive search).
  // If the header is not found, returns std::nullopt.
  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view key) const noexcept;

  [[nodiscard]] const vector<Header>& headers() const noexcept { return _headers; }

  HttpResponse& status(http::StatusCode statusCode) & noexcept {
    _status = statusCode;
    return *this;
  }

  HttpResponse&& status(http::StatusCode statusCode) && noexcept {
    _status = statusCode;
    return std::move(*this);
  }

  // Replaces the status code and the reason phrase.
  HttpResponse& status(http::StatusCode statusCode, std::string_view reason) & {
    _status = statusCode;
    _reason.assign(reason);
    return *this;
  }

  HttpResponse&& status(http::StatusCode statusCode, std::string_view reason) && {
    _status = statusCode;
    _reason.assign(reason);
    return std::move(*this);
  }

  HttpResponse& reason(std::string_view reason) & {
    _reason.assign(reason);
    return *this;
  }

  HttpResponse&& reason(std::string_view reason) && {
    _reason.assign(reason);
    return std::move(*this);
  }

  // Inserts or replaces the header 'key'.
  HttpResponse& header(std::string_view key, std::string_view value) &;

  HttpResponse&& header(std::string_view key, std::string_view value) && {
    header(key, value);
    return std::move(*this);
  }

  // Inserts or replaces the Location header.
  HttpResponse& location(std::string_view src) & { return header(http::Location, src); }

  HttpResponse&& location(std::string_view src) && {
    header(http::Location, src);
    return std::move(*this);
  }

  // Sets the body and its content type. An empty body removes the Content-Type header.
  HttpResponse& body(std::string_view body, std::string_view contentType = http::ContentTypeTextPlain) &;

  HttpResponse&& body(std::string_view body, std::string_view contentType = http::ContentTypeTextPlain) && {
    this->body(body, contentType);
    return std::move(*this);
  }

 private:
  // Returns the first header whose name equals 'key' (case-insensitive), or end().
  [[nodiscard]] vector<Header>::iterator findHeader(std::string_view key) noexcept;
  [[nodiscard]] vector<Header>::const_iterator findHeader(std::string_view key) const noexcept;

  void eraseHeader(std::string_view key) noexcept;

  http::StatusCode _status;
  std::string _reason;
  vector<Header> _headers;
  std::string _body;
};

}  // namespace arbor

#include "arbor/http-response.hpp"

#include <algorithm>
#include <optional>
#include <string>
#include <string_view>

#include "arbor/http-constants.hpp"
#include "arbor/http-status-code.hpp"
#include "arbor/string-equal-ignore-case.hpp"

namespace arbor {

namespace {

template <class Headers>
auto FindHeader(Headers& headers, std::string_view key) noexcept {
  return std::ranges::find_if(headers, [key](const auto& hdr) { return CaseInsensitiveEqual(hdr.name, key); });
}

}  // namespace

HttpResponse::HttpResponse(http::StatusCode code, std::string_view reason)
    : _status(code), _reason(reason.empty() ? http::ReasonPhraseFor(code) : reason) {}

HttpResponse::HttpResponse(std::string_view body, std::string_view contentType)
    : _status(http::StatusCodeOK), _reason(http::ReasonOK) {
  this->body(body, contentType);
}

std::optional<std::string_view> HttpResponse::headerValue(std::string_view key) const noexcept {
  const auto it = findHeader(key);
  if (it == _headers.end()) {
    return std::nullopt;
  }
  return std::string_view(it->value);
}

HttpResponse& HttpResponse::header(std::string_view key, std::string_view value) & {
  auto it = findHeader(key);
  if (it == _headers.end()) {
    _headers.emplace_back(std::string(key), std::string(value));
  } else {
    it->value.assign(value);
  }
  return *this;
}

HttpResponse& HttpResponse::body(std::string_view body, std::string_view contentType) & {
  _body.assign(body);
  if (body.empty()) {
    eraseHeader(http::ContentType);
  } else {
    header(http::ContentType, contentType);
  }
  return *this;
}

vector<HttpResponse::Header>::iterator HttpResponse::findHeader(std::string_view key) noexcept {
  return FindHeader(_headers, key);
}

vector<HttpResponse::Header>::const_iterator HttpResponse::findHeader(std::string_view key) const noexcept {
  return FindHeader(_headers, key);
}

void HttpResponse::eraseHeader(std::string_view key) noexcept {
  const auto it = findHeader(key);
  if (it != _headers.end()) {
    _headers.erase(it);
  }
}

}  // namespace arbor

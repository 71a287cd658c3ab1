#pragma once

#include <optional>
#include <string_view>

#include "arbor/flat-hash-map.hpp"

namespace arbor {

// Request-scoped path parameters: parameter name -> captured segment value.
// Names view the route tree, values view the request path.
using PathParams = flat_hash_map<std::string_view, std::string_view>;

// Inbound request descriptor, built by the transport layer from the request line.
// It does not own the method and path buffers, which must outlive it.
class HttpRequest {
 public:
  HttpRequest(std::string_view method, std::string_view path) noexcept : _method(method), _path(path) {}

  // The method token as received (e.g. "GET").
  [[nodiscard]] std::string_view method() const noexcept { return _method; }

  // The request path, without query string.
  [[nodiscard]] std::string_view path() const noexcept { return _path; }

  // Path parameters captured for the matched route.
  // For instance, a request to "/users/42" served by the route "/users/:id" has {"id": "42"}.
  [[nodiscard]] const PathParams& pathParams() const noexcept { return _pathParams; }

  // Returns the value captured for the path parameter 'name', if any.
  [[nodiscard]] std::optional<std::string_view> pathParam(std::string_view name) const {
    const auto it = _pathParams.find(name);
    if (it == _pathParams.end()) {
      return std::nullopt;
    }
    return it->second;
  }

 private:
  friend class Router;

  std::string_view _method;
  std::string_view _path;
  PathParams _pathParams;
};

}  // namespace arbor

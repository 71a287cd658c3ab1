#pragma once

#include <functional>

#include "arbor/http-response.hpp"

namespace arbor {

class HttpRequest;

// Request handler type: receives a const HttpRequest& and returns an HttpResponse.
// An empty RequestHandler registered on a path keeps the path in the route tree but serves nothing.
using RequestHandler = std::function<HttpResponse(const HttpRequest&)>;

}  // namespace arbor

#include "arbor/router.hpp"

#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <utility>

#include "arbor/http-constants.hpp"
#include "arbor/http-method.hpp"
#include "arbor/http-request.hpp"
#include "arbor/http-response.hpp"
#include "arbor/http-status-code.hpp"
#include "arbor/path-handlers.hpp"
#include "arbor/route-tree.hpp"
#include "arbor/router-config.hpp"
#include "invalid_argument_exception.hpp"
#include "log.hpp"

namespace arbor {

namespace {

constexpr std::string_view kRedirectBody = "Redirecting";

HttpResponse NotFoundResponse() {
  HttpResponse resp(http::StatusCodeNotFound, http::NotFound);
  resp.body(http::NotFound);
  return resp;
}

}  // namespace

void Router::setPath(http::Method method, std::string_view path, RequestHandler handler) {
  setPath(static_cast<http::MethodBmp>(method), path, std::move(handler));
}

void Router::setPath(http::MethodBmp methods, std::string_view path, RequestHandler handler) {
  if ((methods & http::kAllMethods) == 0) {
    throw invalid_argument("setPath requires at least one method");
  }
  RouteTree::ValidatePath(path);

  std::shared_ptr<const RequestHandler> sharedHandler;
  if (handler) {
    sharedHandler = std::make_shared<const RequestHandler>(std::move(handler));
  }

  std::unique_lock lock(_mutex, std::defer_lock);
  if (_config.concurrentRegistration) {
    lock.lock();
  }

  for (http::MethodIdx methodIdx = 0; methodIdx < http::kNbMethods; ++methodIdx) {
    if (!http::IsMethodSet(methods, methodIdx)) {
      continue;
    }
    auto& pTree = _trees[methodIdx];
    if (!pTree) {
      pTree = std::make_unique<RouteTree>();
    }
    const std::string_view methodStr = http::kMethodStrings[methodIdx];
    if (pTree->insert(path, sharedHandler)) {
      log::warn("Overwriting existing path handler for {} {}", methodStr, path);
    }
    log::debug("Registered {} {}{}", methodStr, path, sharedHandler ? "" : " (no handler)");
  }
}

Router::RoutingResult Router::match(http::Method method, std::string_view path, PathParams& pathParams) const {
  std::shared_lock lock(_mutex, std::defer_lock);
  if (_config.concurrentRegistration) {
    lock.lock();
  }

  RoutingResult result;
  const RouteTree* pTree = _trees[http::MethodToIdx(method)].get();
  if (pTree == nullptr || path.empty() || path.front() != RouteTree::kSeparator) {
    return result;
  }

  const RouteTree::WalkResult walkResult = pTree->walk(path.substr(1), pathParams);
  switch (walkResult.outcome) {
    case RouteTree::WalkResult::Outcome::Matched:
      result.handler = walkResult.node->handler;
      return result;
    case RouteTree::WalkResult::Outcome::Boundary:
      result.redirectPathIndicator = computeRedirectSlashMode(path, walkResult);
      break;
    case RouteTree::WalkResult::Outcome::DeadEnd:
      break;
  }

  pathParams.clear();
  return result;
}

Router::RoutingResult::RedirectSlashMode Router::computeRedirectSlashMode(
    std::string_view path, const RouteTree::WalkResult& walkResult) const {
  if (_config.trailingSlashPolicy != RouterConfig::TrailingSlashPolicy::Redirect) {
    return RoutingResult::RedirectSlashMode::None;
  }
  if (path.back() == RouteTree::kSeparator) {
    // The canonical route is the parent of the empty trailing segment.
    if (walkResult.previous != nullptr && walkResult.previous->hasHandler()) {
      return RoutingResult::RedirectSlashMode::RemoveSlash;
    }
  } else if (walkResult.node != nullptr) {
    const RouteTree::Node* pTrailingNode = walkResult.node->literalChild({});
    if (pTrailingNode != nullptr && pTrailingNode->hasHandler()) {
      return RoutingResult::RedirectSlashMode::AddSlash;
    }
  }
  return RoutingResult::RedirectSlashMode::None;
}

HttpResponse Router::serve(HttpRequest& request) const {
  request._pathParams.clear();

  const std::optional<http::Method> optMethod = http::MethodFromStr(request.method());
  if (!optMethod) {
    return NotFoundResponse();
  }

  const RoutingResult routingResult = match(*optMethod, request.path(), request._pathParams);
  if (routingResult.handler) {
    try {
      return (*routingResult.handler)(request);
    } catch (const std::exception& ex) {
      log::error("Exception in path handler for {} {}: {}", request.method(), request.path(), ex.what());
      HttpResponse resp(http::StatusCodeInternalServerError, http::ReasonInternalServerError);
      resp.body(ex.what());
      return resp;
    } catch (...) {
      log::error("Unknown exception in path handler for {} {}", request.method(), request.path());
      HttpResponse resp(http::StatusCodeInternalServerError, http::ReasonInternalServerError);
      resp.body("Unknown error");
      return resp;
    }
  }

  if (routingResult.redirectPathIndicator == RoutingResult::RedirectSlashMode::None) {
    return NotFoundResponse();
  }

  HttpResponse resp;
  if (http::IsPermanentRedirectSafe(*optMethod)) {
    resp.status(http::StatusCodeMovedPermanently, http::MovedPermanently);
  } else {
    resp.status(http::StatusCodeTemporaryRedirect, http::TemporaryRedirect);
  }
  resp.body(kRedirectBody);

  const std::string_view path = request.path();
  if (routingResult.redirectPathIndicator == RoutingResult::RedirectSlashMode::AddSlash) {
    std::string location(path);
    location.push_back(RouteTree::kSeparator);
    resp.location(location);
  } else {
    resp.location(path.substr(0, path.size() - 1U));
  }
  return resp;
}

std::string Router::dumpRoutes() const {
  std::shared_lock lock(_mutex, std::defer_lock);
  if (_config.concurrentRegistration) {
    lock.lock();
  }

  std::string out;
  for (http::MethodIdx methodIdx = 0; methodIdx < http::kNbMethods; ++methodIdx) {
    if (_trees[methodIdx]) {
      _trees[methodIdx]->dump(out, http::kMethodStrings[methodIdx]);
    }
  }
  return out;
}

}  // namespace arbor

#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <utility>

#include "arbor/http-method.hpp"
#include "arbor/http-request.hpp"
#include "arbor/http-response.hpp"
#include "arbor/path-handlers.hpp"
#include "arbor/route-tree.hpp"
#include "arbor/router-config.hpp"

namespace arbor {

class Router {
 public:
  struct RoutingResult {
    enum class RedirectSlashMode : int8_t {
      None,        // Indicates that no redirection is needed
      AddSlash,    // Indicates that a redirection to add a trailing slash is needed
      RemoveSlash  // Indicates that a redirection to remove a trailing slash is needed
    };

    // The handler of the matched route, nullptr if there is none.
    // It is shared with the route tree so that it stays alive even if the route is registered again meanwhile.
    std::shared_ptr<const RequestHandler> handler;

    RedirectSlashMode redirectPathIndicator{RedirectSlashMode::None};
  };

  // Creates an empty Router with the 'Redirect' trailing slash policy and concurrent registration enabled.
  Router() = default;

  // Creates an empty Router with the configuration taken from the provided object.
  // The configuration cannot be changed afterwards.
  explicit Router(RouterConfig config) : _config(std::move(config)) {}

  // A Router owns a lock and is shared by reference between serving threads.
  Router(const Router&) = delete;
  Router(Router&&) = delete;
  Router& operator=(const Router&) = delete;
  Router& operator=(Router&&) = delete;

  ~Router() = default;

  // Register a handler for a specific absolute path and a unique HTTP method.
  //
  // Path syntax: literal segments separated by '/', a segment starting with ':' being a named parameter
  // whose value is captured at match time (e.g. "/users/:userId/posts/:postId").
  // Registering the same method and path again replaces the handler (a warning is logged).
  // An empty handler is accepted: the path is kept in the route tree (it still matters for trailing slash
  // redirects) but requests to it are not found.
  //
  // Throws:
  //   - invalid_path if path does not start with '/' (router untouched)
  //   - route_conflict if a parameter is named differently than the one already registered at the same position
  void setPath(http::Method method, std::string_view path, RequestHandler handler);

  // Register a handler for a specific absolute path and a set of HTTP methods.
  // Methods are registered one after the other; if one fails with route_conflict, the previous ones stay registered.
  void setPath(http::MethodBmp methods, std::string_view path, RequestHandler handler);

  void onGet(std::string_view path, RequestHandler handler) { setPath(http::Method::GET, path, std::move(handler)); }

  void onHead(std::string_view path, RequestHandler handler) { setPath(http::Method::HEAD, path, std::move(handler)); }

  void onPost(std::string_view path, RequestHandler handler) { setPath(http::Method::POST, path, std::move(handler)); }

  void onPut(std::string_view path, RequestHandler handler) { setPath(http::Method::PUT, path, std::move(handler)); }

  void onPatch(std::string_view path, RequestHandler handler) {
    setPath(http::Method::PATCH, path, std::move(handler));
  }

  void onDelete(std::string_view path, RequestHandler handler) {
    setPath(http::Method::DELETE, path, std::move(handler));
  }

  void onOptions(std::string_view path, RequestHandler handler) {
    setPath(http::Method::OPTIONS, path, std::move(handler));
  }

  void onTrace(std::string_view path, RequestHandler handler) {
    setPath(http::Method::TRACE, path, std::move(handler));
  }

  void onConnect(std::string_view path, RequestHandler handler) {
    setPath(http::Method::CONNECT, path, std::move(handler));
  }

  // Match the provided `path` for `method` and return the matching handler, or a redirect indication.
  // There is no fallback to another method.
  //
  // Captured path parameters are stored into `pathParams`, which is left empty when no handler matches.
  // Captured values point into `path`, and keys into the router's route tree.
  [[nodiscard]] RoutingResult match(http::Method method, std::string_view path, PathParams& pathParams) const;

  // Serves `request`: fills its path parameters and invokes the matched handler, or builds a trailing slash redirect
  // response (301 for GET and HEAD, 307 for other methods, with a Location header) or a 404 response.
  // Never throws: an exception escaping from the handler is logged and answered with a 500 response.
  [[nodiscard]] HttpResponse serve(HttpRequest& request) const;

  // Returns a human-readable rendering of all the registered routes, method by method.
  [[nodiscard]] std::string dumpRoutes() const;

  [[nodiscard]] const RouterConfig& config() const noexcept { return _config; }

 private:
  RoutingResult::RedirectSlashMode computeRedirectSlashMode(std::string_view path,
                                                            const RouteTree::WalkResult& walkResult) const;

  RouterConfig _config;

  // One tree per method, created at the first registration of that method.
  std::array<std::unique_ptr<RouteTree>, http::kNbMethods> _trees;

  mutable std::shared_mutex _mutex;
};

}  // namespace arbor

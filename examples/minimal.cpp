#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <string_view>

#include "arbor/http-constants.hpp"
#include "arbor/http-method.hpp"
#include "arbor/http-request.hpp"
#include "arbor/http-response.hpp"
#include "arbor/router-config.hpp"
#include "arbor/router-errors.hpp"
#include "arbor/router.hpp"
#include "log.hpp"

using namespace arbor;

int main(int argc, char **argv) {
  log::set_level(log::level::debug);

  Router router(RouterConfig{}.withTrailingSlashPolicy(RouterConfig::TrailingSlashPolicy::Redirect));

  try {
    router.onGet("/", [](const HttpRequest &) { return HttpResponse("Hello from arbor!"); });
    router.onGet("/users/:userId", [](const HttpRequest &req) {
      std::string body("User ");
      body.append(req.pathParam("userId").value_or("?"));
      return HttpResponse(body);
    });
    router.onGet("/users/:userId/posts/", [](const HttpRequest &req) {
      std::string body("Posts of user ");
      body.append(req.pathParam("userId").value_or("?"));
      return HttpResponse(body);
    });
    router.setPath(http::Method::POST | http::Method::PUT, "/users/:userId",
                   [](const HttpRequest &req) { return HttpResponse(http::StatusCodeCreated).body(req.method()); });

    // Rejected: the parameter at this position is already named 'userId'
    router.onDelete("/users/:userId", [](const HttpRequest &) { return HttpResponse(http::StatusCodeNoContent); });
    router.onDelete("/users/:id/posts", [](const HttpRequest &) { return HttpResponse(http::StatusCodeNoContent); });
  } catch (const route_conflict &ex) {
    log::error("Route registration failed: {}", ex.what());
  }

  log::info("Registered routes:\n{}", router.dumpRoutes());

  // Each argument pair is a request line, for instance: GET /users/42/posts
  for (int argPos = 1; argPos + 1 < argc; argPos += 2) {
    HttpRequest req(argv[argPos], argv[argPos + 1]);
    const HttpResponse resp = router.serve(req);
    std::cout << req.method() << ' ' << req.path() << " -> " << resp.status() << ' ' << resp.reason();
    const auto location = resp.headerValue(http::Location);
    if (location) {
      std::cout << " (Location: " << *location << ')';
    }
    std::cout << '\n' << resp.body() << '\n';
  }

  if (argc < 3) {
    try {
      for (std::string_view path : {"/", "/users/42", "/users/42/", "/users/42/posts", "/nowhere"}) {
        HttpRequest req("GET", path);
        const HttpResponse resp = router.serve(req);
        log::info("GET {} -> {} {}", path, resp.status(), resp.body());
      }
    } catch (const std::exception &ex) {
      std::cerr << "Unexpected error: " << ex.what() << '\n';
      return EXIT_FAILURE;
    }
  }
  return EXIT_SUCCESS;
}

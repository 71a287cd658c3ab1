#pragma once

#include <cstdint>

namespace arbor {

struct RouterConfig {
  enum class TrailingSlashPolicy : std::int8_t { Strict, Redirect };

  // Behavior for requests that differ from a registered route only by a trailing slash.
  //   Strict   : exact matching only, such requests are not found (404).
  //   Redirect : if /foo is registered, /foo/ is redirected to /foo. If /foo/ is registered, /foo is redirected to
  //              /foo/. If both are registered, each is served as requested and no redirection occurs.
  // Default: Redirect
  TrailingSlashPolicy trailingSlashPolicy{TrailingSlashPolicy::Redirect};

  // When true (default), route registration takes an exclusive lock on the route trees and each match takes a
  // shared lock, so routes can be added while requests are being served.
  // Setting it to false removes the lock from the request path. The caller then guarantees that all registrations
  // happen before any concurrent matching (typically, all routes are set before the server starts accepting
  // connections). Registering a route while another thread matches is a data race in this mode.
  bool concurrentRegistration{true};

  RouterConfig& withTrailingSlashPolicy(TrailingSlashPolicy policy);

  RouterConfig& withConcurrentRegistration(bool enable = true);
};

}  // namespace arbor

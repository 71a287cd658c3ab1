#pragma once

#include <spdlog/fmt/fmt.h>

#include <utility>

#include "exception.hpp"
#include "invalid_argument_exception.hpp"

namespace arbor {

// Thrown at registration when a route path does not start with '/'. The router is left untouched.
class invalid_path : public invalid_argument {
 public:
  template <typename... Args>
  explicit invalid_path(fmt::format_string<Args...> fmtStr, Args&&... args)
      : invalid_argument(fmtStr, std::forward<Args>(args)...) {}
};

// Thrown at registration when a path parameter name differs from the one already bound at the same position,
// for instance registering "/:bar" after "/:foo".
// Registration is not transactional: nodes created before the conflicting segment are kept (without handler), and
// for a multi-method registration, the methods processed before the failing one stay registered.
class route_conflict : public exception {
 public:
  template <typename... Args>
  explicit route_conflict(fmt::format_string<Args...> fmtStr, Args&&... args)
      : exception(fmtStr, std::forward<Args>(args)...) {}
};

}  // namespace arbor

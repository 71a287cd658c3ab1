#include "arbor/router-config.hpp"

namespace arbor {

RouterConfig& RouterConfig::withTrailingSlashPolicy(TrailingSlashPolicy policy) {
  trailingSlashPolicy = policy;
  return *this;
}

RouterConfig& RouterConfig::withConcurrentRegistration(bool enable) {
  concurrentRegistration = enable;
  return *this;
}

}  // namespace arbor

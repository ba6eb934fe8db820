#pragma once

#include "offline/worker/v1/http.pb.h"

namespace offline::routing {

/*
  Classification result for one request. Derived, never persisted.
*/
struct RoutePolicy {
  offline::worker::v1::RouteClass route_class = offline::worker::v1::ROUTE_CLASS_OTHER;
  offline::worker::v1::Strategy   strategy    = offline::worker::v1::STRATEGY_PASSTHROUGH;

  bool Intercepted() const {
    return strategy != offline::worker::v1::STRATEGY_PASSTHROUGH;
  }

  // fallback kind for cache-first failures
  bool IsNavigation() const {
    return route_class == offline::worker::v1::ROUTE_CLASS_NAVIGATION;
  }
};

inline bool operator==(const RoutePolicy& a, const RoutePolicy& b) {
  return a.route_class == b.route_class && a.strategy == b.strategy;
}

} // namespace offline::routing

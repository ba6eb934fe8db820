#include "route_classifier.hpp"

#include <algorithm>

namespace offline::routing {

using namespace offline::worker::v1;

RouteClassifier::RouteClassifier(std::vector<std::string> api_prefixes) : api_prefixes_(std::move(api_prefixes)) {
}

bool RouteClassifier::IsApiPath(const std::string& path) const {
  return std::any_of(api_prefixes_.begin(), api_prefixes_.end(),
                     [&](const std::string& prefix) { return offline::util::HasPathPrefix(path, prefix); });
}

RoutePolicy RouteClassifier::Classify(const std::string& method, const offline::util::Url& url, RequestMode mode) const {
  if (method != "GET" || url.IsSocketScheme()) {
    return {ROUTE_CLASS_OTHER, STRATEGY_PASSTHROUGH};
  }

  if (IsApiPath(url.path)) {
    return {ROUTE_CLASS_API_CALL, STRATEGY_NETWORK_FIRST};
  }

  if (mode == REQUEST_MODE_NAVIGATE) {
    return {ROUTE_CLASS_NAVIGATION, STRATEGY_CACHE_FIRST};
  }

  return {ROUTE_CLASS_STATIC_ASSET, STRATEGY_CACHE_FIRST};
}

} // namespace offline::routing

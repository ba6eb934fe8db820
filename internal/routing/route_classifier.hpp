#pragma once

#include <string>
#include <vector>

#include "internal/util/url.hpp"
#include "route_policy.hpp"

namespace offline::routing {

/*
  Maps (method, URL, mode) to a RoutePolicy. Rules, first match wins:

    1. non-GET, or ws:/wss: scheme      → other / passthrough
    2. path under a configured API prefix → api-call / network-first
    3. anything else                     → navigation or static-asset / cache-first

  Pure: no I/O, no state besides the prefix list.
*/
class RouteClassifier {
 public:
  explicit RouteClassifier(std::vector<std::string> api_prefixes);

  RoutePolicy Classify(const std::string& method, const offline::util::Url& url, offline::worker::v1::RequestMode mode) const;

  bool IsApiPath(const std::string& path) const;

 private:
  std::vector<std::string> api_prefixes_;
};

} // namespace offline::routing

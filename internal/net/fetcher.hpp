#pragma once

#include <memory>

#include "offline/worker/v1/http.pb.h"

namespace offline::net {

/*
  Network boundary.

  Fetch performs one request against the real network and returns the
  response with its body fully read. Any received status (2xx or not) is a
  response; only transport failures throw util::NetworkError.

  Timeouts belong to the implementation's I/O stack.
*/
class Fetcher {
 public:
  virtual ~Fetcher() = default;

  virtual offline::worker::v1::HttpResponse Fetch(const offline::worker::v1::HttpRequest& request) = 0;
};

using FetcherPtr = std::shared_ptr<Fetcher>;

// 2xx
inline bool IsOk(const offline::worker::v1::HttpResponse& response) {
  return response.status() >= 200 && response.status() <= 299;
}

} // namespace offline::net

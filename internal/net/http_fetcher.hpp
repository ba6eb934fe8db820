#pragma once

#include <chrono>

#include "fetcher.hpp"
#include "internal/util/url.hpp"

namespace offline::net {

/*
  Blocking HTTP/1.1 client (Boost.Beast).

  One connection per request; relative URLs resolve against `origin`.
  Plain http only. The I/O timeout covers connect, write and read together.
*/
class HttpFetcher final : public Fetcher {
 public:
  HttpFetcher(offline::util::Url origin, std::chrono::milliseconds io_timeout);

  offline::worker::v1::HttpResponse Fetch(const offline::worker::v1::HttpRequest& request) override;

 private:
  offline::util::Url        origin_;
  std::chrono::milliseconds io_timeout_;
};

} // namespace offline::net

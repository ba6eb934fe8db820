#pragma once

#include <memory>
#include <string>

#include "cancellation.hpp"
#include "internal/cache/cache_storage.hpp"
#include "internal/cache/write_back_queue.hpp"
#include "internal/net/fetcher.hpp"
#include "offline_fallback.hpp"
#include "offline/worker/v1/http.pb.h"

namespace offline::strategy {

// Current generation names; passed explicitly into every cache operation.
struct Generations {
  std::string static_name;
  std::string dynamic_name;
};

/*
  Cache-first and network-first execution.

  Successful (2xx) network responses are copied into the dynamic
  generation through the write-back queue; the caller's response and the
  stored snapshot never share state. Non-2xx responses are returned as-is
  and never stored. Strategies do not retry.

  Only transport failures (util::NetworkError) trigger cache or fallback
  answers; a cancelled token stops before the network is contacted.
*/
class StrategyEngine {
 public:
  StrategyEngine(offline::net::FetcherPtr                        fetcher,
                 offline::cache::CacheStoragePtr                 storage,
                 std::shared_ptr<offline::cache::WriteBackQueue> write_back,
                 std::shared_ptr<OfflineFallback>                fallback);

  offline::worker::v1::HttpResponse CacheFirst(const offline::worker::v1::HttpRequest& request,
                                               const std::string&                      key,
                                               const Generations&                      generations,
                                               offline::worker::v1::RouteClass         kind,
                                               const CancellationToken&                cancel = {});

  offline::worker::v1::HttpResponse NetworkFirst(const offline::worker::v1::HttpRequest& request,
                                                 const std::string&                      key,
                                                 const Generations&                      generations,
                                                 const CancellationToken&                cancel = {});

 private:
  std::optional<offline::worker::v1::HttpResponse> Lookup(const std::string& generation, const std::string& key) const;

  void StoreCopy(const std::string& generation, const std::string& key, const offline::worker::v1::HttpResponse& response);

  offline::net::FetcherPtr                        fetcher_;
  offline::cache::CacheStoragePtr                 storage_;
  std::shared_ptr<offline::cache::WriteBackQueue> write_back_;
  std::shared_ptr<OfflineFallback>                fallback_;
};

} // namespace offline::strategy

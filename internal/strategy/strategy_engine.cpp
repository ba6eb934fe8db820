#include "strategy_engine.hpp"

#include "internal/net/headers.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace offline::strategy {

using offline::worker::v1::HttpRequest;
using offline::worker::v1::HttpResponse;

namespace {

constexpr const char* kStaleHeader = "X-Offline-Cache";

const char* SourceName(offline::worker::v1::ResponseSource source) {
  switch (source) {
    case offline::worker::v1::RESPONSE_SOURCE_NETWORK:
      return "network";
    case offline::worker::v1::RESPONSE_SOURCE_CACHE:
      return "cache";
    case offline::worker::v1::RESPONSE_SOURCE_FALLBACK:
      return "fallback";
    case offline::worker::v1::RESPONSE_SOURCE_OUTBOX:
      return "outbox";
    default:
      return "unknown";
  }
}

HttpResponse Served(const char* strategy, HttpResponse response) {
  offline::observability::Metrics::Instance().RecordFetchServed(strategy, SourceName(response.source()));
  return response;
}

void ThrowIfCancelled(const CancellationToken& cancel, const HttpRequest& request) {
  if (cancel.IsCancelled()) {
    throw offline::util::Cancelled("fetch cancelled: " + request.url());
  }
}

} // namespace

StrategyEngine::StrategyEngine(offline::net::FetcherPtr                        fetcher,
                               offline::cache::CacheStoragePtr                 storage,
                               std::shared_ptr<offline::cache::WriteBackQueue> write_back,
                               std::shared_ptr<OfflineFallback>                fallback)
    : fetcher_(std::move(fetcher)), storage_(std::move(storage)), write_back_(std::move(write_back)), fallback_(std::move(fallback)) {
}

HttpResponse StrategyEngine::CacheFirst(const HttpRequest&              request,
                                        const std::string&              key,
                                        const Generations&              generations,
                                        offline::worker::v1::RouteClass kind,
                                        const CancellationToken&        cancel) {
  for (const auto* generation : {&generations.dynamic_name, &generations.static_name}) {
    if (auto hit = Lookup(*generation, key)) {
      hit->set_source(offline::worker::v1::RESPONSE_SOURCE_CACHE);
      return Served("cache_first", std::move(*hit));
    }
  }

  ThrowIfCancelled(cancel, request);

  HttpResponse response;
  try {
    response = fetcher_->Fetch(request);
  } catch (const offline::util::NetworkError& e) {
    OFFLINE_LOG_DEBUG("cache-first miss while offline", {offline::observability::StringField("key", key),
                                                         offline::observability::StringField("error", e.what())});
    return Served("cache_first", fallback_->For(kind, generations.static_name));
  }

  if (offline::net::IsOk(response)) {
    StoreCopy(generations.dynamic_name, key, response);
  }
  return Served("cache_first", std::move(response));
}

HttpResponse StrategyEngine::NetworkFirst(const HttpRequest&       request,
                                          const std::string&       key,
                                          const Generations&       generations,
                                          const CancellationToken& cancel) {
  ThrowIfCancelled(cancel, request);

  try {
    auto response = fetcher_->Fetch(request);
    if (offline::net::IsOk(response)) {
      StoreCopy(generations.dynamic_name, key, response);
    }
    return Served("network_first", std::move(response));
  } catch (const offline::util::NetworkError& e) {
    OFFLINE_LOG_DEBUG("network-first falling back to cache", {offline::observability::StringField("key", key),
                                                              offline::observability::StringField("error", e.what())});
  }

  if (auto stale = Lookup(generations.dynamic_name, key)) {
    offline::net::SetHeader(&*stale, kStaleHeader, "true");
    stale->set_source(offline::worker::v1::RESPONSE_SOURCE_CACHE);
    return Served("network_first", std::move(*stale));
  }
  return Served("network_first", OfflineFallback::ServiceUnavailable());
}

std::optional<HttpResponse> StrategyEngine::Lookup(const std::string& generation, const std::string& key) const {
  if (generation.empty()) return std::nullopt;

  // an unreadable entry is a miss
  try {
    return storage_->Match(generation, key);
  } catch (const offline::util::StorageError& e) {
    OFFLINE_LOG_WARN("cache read failed", {offline::observability::StringField("generation", generation),
                                           offline::observability::StringField("key", key),
                                           offline::observability::StringField("error", e.what())});
    return std::nullopt;
  }
}

void StrategyEngine::StoreCopy(const std::string& generation, const std::string& key, const HttpResponse& response) {
  if (generation.empty()) return;

  offline::cache::WriteBackTask task;
  task.generation = generation;
  task.key        = key;
  task.snapshot   = response;
  task.snapshot.clear_source();
  write_back_->Enqueue(std::move(task));
}

} // namespace offline::strategy

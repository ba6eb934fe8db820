#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/net/fetcher.hpp"
#include "internal/util/url.hpp"
#include "sync_store.hpp"

namespace offline::sync {

/*
  Offline outbox for mutations.

  A non-GET request under one of the outbox prefixes whose passthrough
  fetch failed at the transport level is stored and answered with

      202 {"queued":true,"message":"Action queued for when you are back online.","actionId":"..."}

  and the outbox tag is registered for background sync. Replay sends the
  actions in capture order; failed ones stay queued in their position.
*/
class Outbox {
 public:
  Outbox(SyncStorePtr store, offline::net::FetcherPtr fetcher, offline::runtime::config::OutboxConfig config);

  bool Enabled() const {
    return config_.enabled();
  }

  const std::string& Tag() const {
    return config_.tag();
  }

  bool Captures(const std::string& method, const offline::util::Url& url) const;

  offline::worker::v1::HttpResponse Capture(const offline::worker::v1::HttpRequest& request);

  // returns the number of actions still queued
  std::size_t Replay();

  std::size_t Size() const;

 private:
  SyncStorePtr                           store_;
  offline::net::FetcherPtr               fetcher_;
  offline::runtime::config::OutboxConfig config_;

  // one replay at a time: concurrent replays would resend the same action
  std::mutex replay_mutex_;
};

} // namespace offline::sync

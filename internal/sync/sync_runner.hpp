#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/cache/cache_storage.hpp"
#include "internal/net/fetcher.hpp"
#include "internal/util/url.hpp"
#include "outbox.hpp"
#include "sync_store.hpp"

namespace offline::sync {

/*
  Executes background sync tags.

  Configured tags are bound to one remote POST with no body. The outbox
  tag replays queued actions. Each Run executes the operation once:

    success → registration removed, dynamic entries under the task's
              invalidate prefixes dropped
    failure → util::SyncFailed, registration kept for the next signal
*/
class SyncRunner {
 public:
  SyncRunner(offline::net::FetcherPtr                          fetcher,
             SyncStorePtr                                      store,
             offline::cache::CacheStoragePtr                   cache,
             std::shared_ptr<Outbox>                           outbox,
             offline::util::Url                                origin,
             const std::vector<offline::runtime::config::SyncTaskConfig>& tasks);

  bool Knows(const std::string& tag) const;

  // throws util::InvalidArgument for an unbound tag
  void Register(const std::string& tag);

  // throws util::NotFound for an unbound tag, util::SyncFailed on failure
  void Run(const std::string& tag, const std::string& dynamic_generation);

  std::vector<std::string> PendingTags() const;

 private:
  void RunTask(const offline::runtime::config::SyncTaskConfig& task, const std::string& dynamic_generation);
  void Invalidate(const offline::runtime::config::SyncTaskConfig& task, const std::string& dynamic_generation);

  offline::net::FetcherPtr        fetcher_;
  SyncStorePtr                    store_;
  offline::cache::CacheStoragePtr cache_;
  std::shared_ptr<Outbox>         outbox_;
  offline::util::Url              origin_;

  std::map<std::string, offline::runtime::config::SyncTaskConfig> tasks_;
};

} // namespace offline::sync

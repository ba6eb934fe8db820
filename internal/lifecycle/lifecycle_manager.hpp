#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/cache/cache_storage.hpp"
#include "internal/clients/client_registry.hpp"
#include "internal/net/fetcher.hpp"
#include "internal/strategy/strategy_engine.hpp"
#include "internal/util/url.hpp"
#include "lifecycle_state.hpp"

namespace offline::lifecycle {

struct LifecycleOptions {
  std::string              static_prefix;
  std::string              dynamic_prefix;
  std::vector<std::string> precache;
  bool                     skip_waiting    = false;
  uint32_t                 default_version = 1;
};

/*
  One installed worker version and the generations it owns.
*/
struct WorkerVersion {
  uint32_t       version = 0;
  std::string    static_generation;
  std::string    dynamic_generation;
  LifecycleState state = LifecycleState::kUnspecified;
};

struct LifecycleSnapshot {
  std::optional<WorkerVersion> active;
  std::optional<WorkerVersion> waiting;
  // most recent install attempt, whatever its outcome
  std::optional<WorkerVersion> latest;
};

/*
  installing → installed (waiting) → activating → active, redundant when
  superseded or when install fails.

  Install pre-warms every manifest asset before anything is written; one
  failed asset abandons the attempt and no static generation is created.
  With no active version, or with skip_waiting, an installed version
  activates immediately. Otherwise it waits for ActivateWaiting().

  The active version cannot be reinstalled while its static generation
  exists. After PurgeAll the same version reinstalls and re-activates at
  once, restoring the generations the running clients point at.

  Activation deletes every generation except the new current pair and
  claims all window clients.
*/
class LifecycleManager {
 public:
  LifecycleManager(offline::cache::CacheStoragePtr                  storage,
                   offline::net::FetcherPtr                         fetcher,
                   std::shared_ptr<offline::clients::ClientRegistry> clients,
                   offline::util::Url                               origin,
                   LifecycleOptions                                 options);

  // version 0 installs the configured default; throws util::InstallFailed,
  // or util::InvalidState for the intact active version
  WorkerVersion Install(uint32_t version);

  // no-op without a waiting version; returns whether one activated
  bool ActivateWaiting();

  // deletes every generation, current ones included; returns the count
  std::size_t PurgeAll();

  strategy::Generations CurrentGenerations() const;

  bool HasActive() const;

  LifecycleSnapshot Snapshot() const;

  static std::string GenerationName(const std::string& prefix, uint32_t version);

 private:
  void ActivateUnlocked();
  void DeleteStaleGenerations(const WorkerVersion& current);
  void SetState(WorkerVersion* version, LifecycleState to);

  offline::cache::CacheStoragePtr                  storage_;
  offline::net::FetcherPtr                         fetcher_;
  std::shared_ptr<offline::clients::ClientRegistry> clients_;
  offline::util::Url                               origin_;
  LifecycleOptions                                 options_;

  // serializes install/activate; never held across a cache read path
  std::mutex install_mutex_;

  mutable std::mutex           mutex_;
  std::optional<WorkerVersion> active_;
  std::optional<WorkerVersion> waiting_;
  std::optional<WorkerVersion> latest_;
};

} // namespace offline::lifecycle

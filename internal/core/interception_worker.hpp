#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/cache/cache_storage.hpp"
#include "internal/clients/client_registry.hpp"
#include "internal/control/control_channel.hpp"
#include "internal/lifecycle/lifecycle_manager.hpp"
#include "internal/net/fetcher.hpp"
#include "internal/push/notification_handler.hpp"
#include "internal/routing/route_classifier.hpp"
#include "internal/strategy/strategy_engine.hpp"
#include "internal/sync/outbox.hpp"
#include "internal/sync/sync_runner.hpp"
#include "internal/sync/sync_scheduler.hpp"
#include "offline/worker/v1.hpp"

namespace offline::core {

struct FetchResult {
  offline::worker::v1::HttpResponse response;
  offline::routing::RoutePolicy     policy;
};

struct WorkerStatus {
  offline::lifecycle::LifecycleSnapshot lifecycle;
  std::vector<std::string>              generations;
  std::vector<std::string>              pending_sync_tags;
  std::size_t                           queued_actions = 0;
  bool                                  online         = true;
};

/*
  The single worker instance shared by every window.

  Holds no request state of its own: the current generation names live in
  the LifecycleManager and are handed explicitly to each cache operation.

  A request is intercepted only while a version is active and the issuing
  client is controlled; everything else is passed through unmodified.
*/
class InterceptionWorker {
 public:
  struct Components {
    offline::net::FetcherPtr                          fetcher;
    offline::cache::CacheStoragePtr                   storage;
    std::shared_ptr<offline::routing::RouteClassifier> classifier;
    std::shared_ptr<offline::strategy::StrategyEngine> strategies;
    std::shared_ptr<offline::lifecycle::LifecycleManager> lifecycle;
    std::shared_ptr<offline::clients::ClientRegistry>  clients;
    std::shared_ptr<offline::push::NotificationHandler> notifications;
    std::shared_ptr<offline::push::NotificationCenter> notification_center;
    std::shared_ptr<offline::sync::SyncRunner>         sync;
    std::shared_ptr<offline::sync::SyncScheduler>      sync_scheduler;
    std::shared_ptr<offline::sync::Outbox>             outbox;
    std::shared_ptr<offline::control::ControlChannel>  control;
  };

  InterceptionWorker(Components components, offline::util::Url origin);

  // ------------------------------------------------------------------
  // Fetch interception
  // ------------------------------------------------------------------
  FetchResult Fetch(const offline::worker::v1::HttpRequest& request, const offline::strategy::CancellationToken& cancel = {});

  // ------------------------------------------------------------------
  // Lifecycle and control
  // ------------------------------------------------------------------
  offline::lifecycle::WorkerVersion Install(uint32_t version);
  offline::control::ControlKind     PostMessage(const std::string& data);
  WorkerStatus                      Status() const;

  // ------------------------------------------------------------------
  // Push and notifications
  // ------------------------------------------------------------------
  offline::worker::v1::Notification              Push(const std::string& data, bool has_data);
  offline::push::ClickResult                     ClickNotification(const std::string& tag, const std::string& action);
  void                                           CloseNotification(const std::string& tag);
  std::vector<offline::worker::v1::Notification> ListNotifications() const;

  // ------------------------------------------------------------------
  // Window clients
  // ------------------------------------------------------------------
  offline::worker::v1::Client              RegisterClient(const std::string& url);
  void                                     UnregisterClient(const std::string& id);
  std::vector<offline::worker::v1::Client> ListClients() const;

  // ------------------------------------------------------------------
  // Background sync
  // ------------------------------------------------------------------
  void RegisterSync(const std::string& tag);

  // runs the tag once; throws util::SyncFailed on a rejected outcome
  void RunSync(const std::string& tag);

  // returns how many pending tags were dispatched to sync workers
  std::size_t SetConnectivity(bool online);

 private:
  offline::worker::v1::HttpResponse Passthrough(const offline::worker::v1::HttpRequest& request, const offline::util::Url& url);

  Components         c_;
  offline::util::Url origin_;

  std::atomic<bool> online_{true};
};

} // namespace offline::core

#include "factory.hpp"

#include <algorithm>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "internal/cache/memory/memory_cache_storage.hpp"
#include "internal/cache/sqlite/sqlite_cache_storage.hpp"
#include "internal/cache/write_back_queue.hpp"
#include "internal/cache/write_back_worker.hpp"
#include "internal/clients/client_registry.hpp"
#include "internal/control/control_channel.hpp"
#include "internal/core/interception_worker.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/grpc/worker_server.hpp"
#include "internal/lifecycle/lifecycle_manager.hpp"
#include "internal/net/http_fetcher.hpp"
#include "internal/observability/logging.hpp"
#include "internal/push/notification_center.hpp"
#include "internal/push/notification_handler.hpp"
#include "internal/routing/route_classifier.hpp"
#include "internal/service/worker_service.hpp"
#include "internal/strategy/offline_fallback.hpp"
#include "internal/strategy/strategy_engine.hpp"
#include "internal/sync/memory/memory_sync_store.hpp"
#include "internal/sync/outbox.hpp"
#include "internal/sync/sqlite/sqlite_sync_store.hpp"
#include "internal/sync/sync_runner.hpp"
#include "internal/sync/sync_scheduler.hpp"
#include "internal/sync/sync_worker.hpp"

namespace offline::factory {

using namespace offline;

namespace {

struct Stores {
  cache::CacheStoragePtr cache;
  sync::SyncStorePtr     sync;
};

Stores BuildStores(const offline::runtime::config::RuntimeConfig& config) {
  const auto& backend = config.cache();
  if (backend.has_sqlite()) {
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(backend.sqlite().path());
    OFFLINE_LOG_INFO("using sqlite backend", {observability::StringField("path", backend.sqlite().path())});
    return {std::make_shared<cache::SqliteCacheStorage>(sqlite_db), std::make_shared<sync::SqliteSyncStore>(sqlite_db)};
  }

  OFFLINE_LOG_INFO("using memory backend");
  return {std::make_shared<cache::MemoryCacheStorage>(), std::make_shared<sync::MemorySyncStore>()};
}

} // namespace

void Application::Drain() {
  if (sync_scheduler) sync_scheduler->Flush();
  if (write_back) write_back->Flush();
}

void Application::StopWorkers() {
  for (auto& worker : sync_workers) worker->Stop();
  for (auto& worker : write_back_workers) worker->Stop();
}

/*
    Build full application dependency graph
*/
Application Build(const offline::runtime::config::RuntimeConfig& config) {
  const auto origin = util::ParseAbsoluteUrl(config.upstream().origin());
  return Build(config, std::make_shared<net::HttpFetcher>(origin, std::chrono::milliseconds(config.upstream().io_timeout_ms())));
}

Application Build(const offline::runtime::config::RuntimeConfig& config, net::FetcherPtr fetcher) {
  Application app;

  const auto origin = util::ParseAbsoluteUrl(config.upstream().origin());

  // ------------------------------------------------------------------
  // Storage
  // ------------------------------------------------------------------
  auto stores = BuildStores(config);

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  auto client_registry = std::make_shared<clients::ClientRegistry>(origin);
  auto classifier      = std::make_shared<routing::RouteClassifier>(
      std::vector<std::string>(config.routes().api_prefixes().begin(), config.routes().api_prefixes().end()));

  auto write_back = std::make_shared<cache::WriteBackQueue>();
  auto fallback   = std::make_shared<strategy::OfflineFallback>(stores.cache, origin, config.routes().offline_page());
  auto strategies = std::make_shared<strategy::StrategyEngine>(fetcher, stores.cache, write_back, fallback);

  lifecycle::LifecycleOptions lifecycle_options;
  lifecycle_options.static_prefix  = config.cache().static_prefix();
  lifecycle_options.dynamic_prefix = config.cache().dynamic_prefix();
  lifecycle_options.precache.assign(config.routes().precache().begin(), config.routes().precache().end());
  lifecycle_options.skip_waiting    = config.lifecycle().skip_waiting();
  lifecycle_options.default_version = config.cache().version();
  auto lifecycle_manager =
      std::make_shared<lifecycle::LifecycleManager>(stores.cache, fetcher, client_registry, origin, std::move(lifecycle_options));

  auto center        = std::make_shared<push::NotificationCenter>();
  auto notifications = std::make_shared<push::NotificationHandler>(center, client_registry, config.notifications());

  auto outbox = std::make_shared<sync::Outbox>(stores.sync, fetcher, config.outbox());
  auto runner = std::make_shared<sync::SyncRunner>(fetcher, stores.sync, stores.cache, outbox, origin,
                                                   std::vector<runtime::config::SyncTaskConfig>(config.sync().tasks().begin(), config.sync().tasks().end()));
  auto sync_scheduler = std::make_shared<sync::SyncScheduler>();
  app.write_back      = write_back;
  app.sync_scheduler  = sync_scheduler;

  auto control_channel = std::make_shared<control::ControlChannel>(lifecycle_manager);

  core::InterceptionWorker::Components components;
  components.fetcher             = fetcher;
  components.storage             = stores.cache;
  components.classifier          = classifier;
  components.strategies          = strategies;
  components.lifecycle           = lifecycle_manager;
  components.clients             = client_registry;
  components.notifications       = notifications;
  components.notification_center = center;
  components.sync                = runner;
  components.sync_scheduler      = sync_scheduler;
  components.outbox              = outbox;
  components.control             = control_channel;

  app.worker = std::make_shared<core::InterceptionWorker>(std::move(components), origin);

  // ------------------------------------------------------------------
  // Background workers
  // ------------------------------------------------------------------
  auto write_back_worker = std::make_shared<cache::WriteBackWorker>(write_back, stores.cache);
  write_back_worker->Start();
  app.write_back_workers.push_back(write_back_worker);

  const auto sync_worker_count = std::max<uint32_t>(1, config.sync().workers());
  for (uint32_t i = 0; i < sync_worker_count; ++i) {
    auto worker = std::make_shared<sync::SyncWorker>(sync_scheduler, app.worker);
    worker->Start();
    app.sync_workers.push_back(worker);
  }

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  auto worker_service = std::make_shared<service::WorkerService>(app.worker);
  app.grpc_services.push_back(std::make_unique<grpc::WorkerServer>(worker_service));

  return app;
}

} // namespace offline::factory

#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"
#include "internal/net/fetcher.hpp"

namespace offline::cache {
class WriteBackQueue;
class WriteBackWorker;
}
namespace offline::core {
class InterceptionWorker;
}
namespace offline::sync {
class SyncScheduler;
class SyncWorker;
}

namespace offline::factory {

/*
  Application

  Owns every long-lived object of the daemon. Background workers are
  stopped (queues drained) when the Application is destroyed.
*/
struct Application {
  std::shared_ptr<offline::core::InterceptionWorker> worker;

  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;

  std::shared_ptr<offline::cache::WriteBackQueue> write_back;
  std::shared_ptr<offline::sync::SyncScheduler>   sync_scheduler;

  std::vector<std::shared_ptr<offline::cache::WriteBackWorker>> write_back_workers;
  std::vector<std::shared_ptr<offline::sync::SyncWorker>>       sync_workers;

  // blocks until queued cache writes and dispatched sync tags are done
  void Drain();

  void StopWorkers();
};

/*
  Build

  Composition root: the only place that knows the concrete cache, sync and
  network backends.
*/
Application Build(const offline::runtime::config::RuntimeConfig& config);

// same graph over a caller-supplied network
Application Build(const offline::runtime::config::RuntimeConfig& config, offline::net::FetcherPtr fetcher);

} // namespace offline::factory

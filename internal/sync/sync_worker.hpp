#pragma once

#include <atomic>
#include <memory>
#include <thread>

#include "sync_scheduler.hpp"

namespace offline::core {
class InterceptionWorker;
}

namespace offline::sync {

/*
  Background worker that runs dispatched sync tags.

  A failed tag stays registered; it runs again on the next connectivity
  signal.
*/
class SyncWorker {
 public:
  SyncWorker(std::shared_ptr<SyncScheduler> scheduler, std::shared_ptr<offline::core::InterceptionWorker> worker);
  ~SyncWorker();

  SyncWorker(const SyncWorker&)            = delete;
  SyncWorker& operator=(const SyncWorker&) = delete;

  void Start();
  void Stop();

 private:
  void Run();

  std::shared_ptr<SyncScheduler>                    scheduler_;
  std::weak_ptr<offline::core::InterceptionWorker> worker_;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace offline::sync

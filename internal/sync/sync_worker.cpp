#include "sync_worker.hpp"

#include "internal/core/interception_worker.hpp"
#include "internal/observability/logging.hpp"

namespace offline::sync {

using offline::observability::StringField;

SyncWorker::SyncWorker(std::shared_ptr<SyncScheduler> scheduler, std::shared_ptr<offline::core::InterceptionWorker> worker)
    : scheduler_(std::move(scheduler)), worker_(std::move(worker)) {
}

SyncWorker::~SyncWorker() {
  Stop();
}

void SyncWorker::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&SyncWorker::Run, this);
}

void SyncWorker::Stop() {
  scheduler_->Shutdown();
  running_ = false;
  if (thread_.joinable()) thread_.join();
}

void SyncWorker::Run() {
  while (true) {
    auto tag = scheduler_->Dequeue();
    if (!tag) break;

    if (auto worker = worker_.lock()) {
      try {
        worker->RunSync(*tag);
      } catch (const std::exception& e) {
        OFFLINE_LOG_WARN("background sync deferred", {StringField("tag", *tag), StringField("error", e.what())});
      }
    }

    scheduler_->MarkDone();
  }
}

} // namespace offline::sync

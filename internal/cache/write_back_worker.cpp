#include "write_back_worker.hpp"

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace offline::cache {

WriteBackWorker::WriteBackWorker(std::shared_ptr<WriteBackQueue> queue, CacheStoragePtr storage)
    : queue_(std::move(queue)), storage_(std::move(storage)) {
}

WriteBackWorker::~WriteBackWorker() {
  Stop();
}

void WriteBackWorker::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&WriteBackWorker::Run, this);
}

void WriteBackWorker::Stop() {
  queue_->Shutdown();
  running_ = false;
  if (thread_.joinable()) thread_.join();
}

void WriteBackWorker::Run() {
  while (true) {
    auto task = queue_->Dequeue();
    if (!task) break;

    try {
      if (storage_->PutExisting(task->generation, task->key, task->snapshot)) {
        offline::observability::Metrics::Instance().RecordCacheWrite(true);
      } else {
        OFFLINE_LOG_DEBUG("cache write skipped; generation retired", {offline::observability::StringField("generation", task->generation),
                                                                     offline::observability::StringField("key", task->key)});
      }
    } catch (const std::exception& e) {
      offline::observability::Metrics::Instance().RecordCacheWrite(false);
      OFFLINE_LOG_WARN("cache write dropped", {offline::observability::StringField("generation", task->generation),
                                               offline::observability::StringField("key", task->key),
                                               offline::observability::StringField("error", e.what())});
    }

    queue_->MarkDone();
  }
}

} // namespace offline::cache

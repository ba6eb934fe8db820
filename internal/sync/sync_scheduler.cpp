#include "sync_scheduler.hpp"

namespace offline::sync {

void SyncScheduler::Enqueue(const std::string& tag) {
  {
    std::lock_guard lock(mutex_);
    queue_.push(tag);
  }
  cv_.notify_one();
}

std::optional<std::string> SyncScheduler::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_ && queue_.empty()) return std::nullopt;

  auto tag = std::move(queue_.front());
  queue_.pop();
  ++in_flight_;
  return tag;
}

void SyncScheduler::MarkDone() {
  {
    std::lock_guard lock(mutex_);
    if (in_flight_ > 0) --in_flight_;
  }
  idle_cv_.notify_all();
}

void SyncScheduler::Flush() {
  std::unique_lock lock(mutex_);
  idle_cv_.wait(lock, [&] { return queue_.empty() && in_flight_ == 0; });
}

void SyncScheduler::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

} // namespace offline::sync

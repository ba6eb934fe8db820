#include "write_back_queue.hpp"

namespace offline::cache {

void WriteBackQueue::Enqueue(WriteBackTask task) {
  {
    std::lock_guard lock(mutex_);
    queue_.push(std::move(task));
  }
  cv_.notify_one();
}

std::optional<WriteBackTask> WriteBackQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_ && queue_.empty()) return std::nullopt;

  WriteBackTask task = std::move(queue_.front());
  queue_.pop();
  ++in_flight_;
  return task;
}

void WriteBackQueue::MarkDone() {
  {
    std::lock_guard lock(mutex_);
    if (in_flight_ > 0) --in_flight_;
  }
  idle_cv_.notify_all();
}

void WriteBackQueue::Flush() {
  std::unique_lock lock(mutex_);
  idle_cv_.wait(lock, [&] { return queue_.empty() && in_flight_ == 0; });
}

void WriteBackQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

} // namespace offline::cache

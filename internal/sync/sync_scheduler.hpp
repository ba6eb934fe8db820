#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>
#include <string>

namespace offline::sync {

/*
  Thread-safe blocking queue of runnable sync tags for sync workers.
*/
class SyncScheduler {
 public:
  void Enqueue(const std::string& tag);

  // blocking wait
  std::optional<std::string> Dequeue();

  void MarkDone();

  // blocks until every dispatched tag has run
  void Flush();

  void Shutdown();

 private:
  std::mutex              mutex_;
  std::condition_variable cv_;
  std::condition_variable idle_cv_;
  std::queue<std::string> queue_;
  std::size_t             in_flight_ = 0;
  bool                    shutdown_  = false;
};

} // namespace offline::sync

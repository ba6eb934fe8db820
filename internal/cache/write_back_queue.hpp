#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>
#include <string>

#include "offline/worker/v1/http.pb.h"

namespace offline::cache {

/*
  A response snapshot waiting to be persisted.

  The snapshot is a full copy taken after the network body was read, so the
  write never shares state with the response handed back to the caller.
*/
struct WriteBackTask {
  std::string                        generation;
  std::string                        key;
  offline::worker::v1::HttpResponse snapshot;
};

/*
  Thread-safe blocking queue for write-back workers.

  Flush() blocks until every task enqueued before the call has been
  processed (stored or dropped).
*/
class WriteBackQueue {
 public:
  void Enqueue(WriteBackTask task);

  // blocking wait
  std::optional<WriteBackTask> Dequeue();

  // worker reports completion of a dequeued task
  void MarkDone();

  void Flush();

  void Shutdown();

 private:
  std::mutex                mutex_;
  std::condition_variable   cv_;
  std::condition_variable   idle_cv_;
  std::queue<WriteBackTask> queue_;
  std::size_t               in_flight_ = 0;
  bool                      shutdown_  = false;
};

} // namespace offline::cache

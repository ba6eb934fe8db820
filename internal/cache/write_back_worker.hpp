#pragma once

#include <atomic>
#include <memory>
#include <thread>

#include "cache_storage.hpp"
#include "write_back_queue.hpp"

namespace offline::cache {

/*
  Background worker that persists response snapshots.

  Storage failures (quota, I/O) are logged and dropped: the caller already
  has its live response. A task whose generation was retired by an
  activation in the meantime is discarded.
*/
class WriteBackWorker {
 public:
  WriteBackWorker(std::shared_ptr<WriteBackQueue> queue, CacheStoragePtr storage);
  ~WriteBackWorker();

  WriteBackWorker(const WriteBackWorker&)            = delete;
  WriteBackWorker& operator=(const WriteBackWorker&) = delete;

  void Start();

  // drains queued tasks, then joins
  void Stop();

 private:
  void Run();

  std::shared_ptr<WriteBackQueue> queue_;
  CacheStoragePtr                 storage_;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace offline::cache

#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "offline/worker/v1/http.pb.h"

namespace offline::sync {

/*
  Durable background-sync state.

    - pending registrations: unique tags, registration order
    - outbox: captured non-GET requests, FIFO by capture order

  Every call is individually atomic. Failures are util::StorageError.
*/
class SyncStore {
 public:
  virtual ~SyncStore() = default;

  // ------------------------------------------------------------------
  // Registrations
  // ------------------------------------------------------------------
  // idempotent; returns false when the tag was already pending
  virtual bool RegisterTag(const std::string& tag) = 0;

  virtual bool RemoveTag(const std::string& tag) = 0;

  virtual bool HasTag(const std::string& tag) const = 0;

  virtual std::vector<std::string> PendingTags() const = 0;

  // ------------------------------------------------------------------
  // Outbox
  // ------------------------------------------------------------------
  virtual void EnqueueAction(const offline::worker::v1::QueuedAction& action) = 0;

  virtual std::vector<offline::worker::v1::QueuedAction> ListActions() const = 0;

  virtual bool RemoveAction(const std::string& id) = 0;

  virtual std::size_t QueuedActions() const = 0;
};

using SyncStorePtr = std::shared_ptr<SyncStore>;

} // namespace offline::sync

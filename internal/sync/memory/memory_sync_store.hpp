#pragma once

#include <deque>
#include <mutex>
#include <string>
#include <vector>

#include "internal/sync/sync_store.hpp"

namespace offline::sync {

/*
  MEMORY sync store. State is lost on restart.
*/
class MemorySyncStore final : public SyncStore {
public:
  bool RegisterTag(const std::string& tag) override;
  bool RemoveTag(const std::string& tag) override;
  bool HasTag(const std::string& tag) const override;
  std::vector<std::string> PendingTags() const override;

  void EnqueueAction(const offline::worker::v1::QueuedAction& action) override;
  std::vector<offline::worker::v1::QueuedAction> ListActions() const override;
  bool RemoveAction(const std::string& id) override;
  std::size_t QueuedActions() const override;

private:
  mutable std::mutex mutex_;
  std::vector<std::string> tags_;
  std::deque<offline::worker::v1::QueuedAction> actions_;
};

} // namespace offline::sync

#include "memory_sync_store.hpp"

#include <algorithm>

namespace offline::sync {

using offline::worker::v1::QueuedAction;

bool MemorySyncStore::RegisterTag(const std::string& tag) {
  std::lock_guard lock(mutex_);
  if (std::find(tags_.begin(), tags_.end(), tag) != tags_.end()) return false;
  tags_.push_back(tag);
  return true;
}

bool MemorySyncStore::RemoveTag(const std::string& tag) {
  std::lock_guard lock(mutex_);
  const auto it = std::find(tags_.begin(), tags_.end(), tag);
  if (it == tags_.end()) return false;
  tags_.erase(it);
  return true;
}

bool MemorySyncStore::HasTag(const std::string& tag) const {
  std::lock_guard lock(mutex_);
  return std::find(tags_.begin(), tags_.end(), tag) != tags_.end();
}

std::vector<std::string> MemorySyncStore::PendingTags() const {
  std::lock_guard lock(mutex_);
  return tags_;
}

void MemorySyncStore::EnqueueAction(const QueuedAction& action) {
  std::lock_guard lock(mutex_);
  actions_.push_back(action);
}

std::vector<QueuedAction> MemorySyncStore::ListActions() const {
  std::lock_guard lock(mutex_);
  return {actions_.begin(), actions_.end()};
}

bool MemorySyncStore::RemoveAction(const std::string& id) {
  std::lock_guard lock(mutex_);
  const auto it = std::find_if(actions_.begin(), actions_.end(), [&](const QueuedAction& a) { return a.id() == id; });
  if (it == actions_.end()) return false;
  actions_.erase(it);
  return true;
}

std::size_t MemorySyncStore::QueuedActions() const {
  std::lock_guard lock(mutex_);
  return actions_.size();
}

} // namespace offline::sync

#pragma once

#include <memory>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/sync/sync_store.hpp"

namespace offline::sync {

/*
  SQLITE sync store.

  Shares the connection with SqliteCacheStorage so pending tags and the
  outbox survive restarts next to the cached generations.

    sync_registration(tag, registered_at_ms)
    outbox_action(seq, id, action)   action = serialized QueuedAction
*/
class SqliteSyncStore final : public SyncStore {
public:
  explicit SqliteSyncStore(std::shared_ptr<offline::db::sqlite::SqliteDB> db);

  static void BootstrapSchema(offline::db::sqlite::SqliteDB& db);

  bool RegisterTag(const std::string& tag) override;
  bool RemoveTag(const std::string& tag) override;
  bool HasTag(const std::string& tag) const override;
  std::vector<std::string> PendingTags() const override;

  void EnqueueAction(const offline::worker::v1::QueuedAction& action) override;
  std::vector<offline::worker::v1::QueuedAction> ListActions() const override;
  bool RemoveAction(const std::string& id) override;
  std::size_t QueuedActions() const override;

private:
  std::shared_ptr<offline::db::sqlite::SqliteDB> db_;
};

} // namespace offline::sync

#include "sqlite_sync_store.hpp"

#include <sqlite3.h>

#include "internal/db/sqlite/sqlite_bind.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace offline::sync {

using offline::db::ThrowIfError;
using offline::worker::v1::QueuedAction;
using namespace offline::db::sqlite;

SqliteSyncStore::SqliteSyncStore(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  BootstrapSchema(*db_);
}

void SqliteSyncStore::BootstrapSchema(SqliteDB& db) {
  db.Exec(
      "CREATE TABLE IF NOT EXISTS sync_registration ("
      "seq INTEGER PRIMARY KEY AUTOINCREMENT, "
      "tag TEXT NOT NULL UNIQUE, "
      "registered_at_ms INTEGER NOT NULL);");
  db.Exec(
      "CREATE TABLE IF NOT EXISTS outbox_action ("
      "seq INTEGER PRIMARY KEY AUTOINCREMENT, "
      "id TEXT NOT NULL UNIQUE, "
      "action BLOB NOT NULL);");
}

bool SqliteSyncStore::RegisterTag(const std::string& tag) {
  auto lock = db_->Lock();

  auto st = db_->Prepare("INSERT OR IGNORE INTO sync_registration(tag, registered_at_ms) VALUES(?, ?);");
  BindText(st.get(), 1, tag);
  BindU64(st.get(), 2, offline::util::NowUnixMillis());
  ThrowIfError(db_->Translate(sqlite3_step(st.get())), "register sync tag " + tag);
  return sqlite3_changes(db_->Handle()) > 0;
}

bool SqliteSyncStore::RemoveTag(const std::string& tag) {
  auto lock = db_->Lock();

  auto st = db_->Prepare("DELETE FROM sync_registration WHERE tag=?;");
  BindText(st.get(), 1, tag);
  ThrowIfError(db_->Translate(sqlite3_step(st.get())), "remove sync tag " + tag);
  return sqlite3_changes(db_->Handle()) > 0;
}

bool SqliteSyncStore::HasTag(const std::string& tag) const {
  auto lock = db_->Lock();

  auto st = db_->Prepare("SELECT 1 FROM sync_registration WHERE tag=?;");
  BindText(st.get(), 1, tag);

  int rc = sqlite3_step(st.get());
  ThrowIfError(db_->Translate(rc), "lookup sync tag " + tag);
  return rc == SQLITE_ROW;
}

std::vector<std::string> SqliteSyncStore::PendingTags() const {
  auto lock = db_->Lock();

  auto st = db_->Prepare("SELECT tag FROM sync_registration ORDER BY seq;");

  std::vector<std::string> tags;
  int rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    tags.push_back(ColText(st.get(), 0));
  }
  ThrowIfError(db_->Translate(rc), "list sync tags");
  return tags;
}

void SqliteSyncStore::EnqueueAction(const QueuedAction& action) {
  auto lock = db_->Lock();

  auto st = db_->Prepare("INSERT INTO outbox_action(id, action) VALUES(?, ?);");
  BindText(st.get(), 1, action.id());
  BindBlob(st.get(), 2, action.SerializeAsString());
  ThrowIfError(db_->Translate(sqlite3_step(st.get())), "queue outbox action " + action.id());
}

std::vector<QueuedAction> SqliteSyncStore::ListActions() const {
  auto lock = db_->Lock();

  auto st = db_->Prepare("SELECT id, action FROM outbox_action ORDER BY seq;");

  std::vector<QueuedAction> actions;
  int rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    QueuedAction action;
    if (!action.ParseFromString(ColBlob(st.get(), 1))) {
      throw offline::util::StorageError("outbox action corrupt: " + ColText(st.get(), 0));
    }
    actions.push_back(std::move(action));
  }
  ThrowIfError(db_->Translate(rc), "list outbox actions");
  return actions;
}

bool SqliteSyncStore::RemoveAction(const std::string& id) {
  auto lock = db_->Lock();

  auto st = db_->Prepare("DELETE FROM outbox_action WHERE id=?;");
  BindText(st.get(), 1, id);
  ThrowIfError(db_->Translate(sqlite3_step(st.get())), "remove outbox action " + id);
  return sqlite3_changes(db_->Handle()) > 0;
}

std::size_t SqliteSyncStore::QueuedActions() const {
  auto lock = db_->Lock();

  auto st = db_->Prepare("SELECT COUNT(*) FROM outbox_action;");
  int  rc = sqlite3_step(st.get());
  ThrowIfError(db_->Translate(rc), "count outbox actions");
  return static_cast<std::size_t>(sqlite3_column_int64(st.get(), 0));
}

} // namespace offline::sync

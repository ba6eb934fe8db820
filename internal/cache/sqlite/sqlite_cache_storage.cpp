#include "sqlite_cache_storage.hpp"

#include <sqlite3.h>

#include "internal/db/sqlite/sqlite_bind.hpp"
#include "internal/db/sqlite/sqlite_tx.hpp"
#include "internal/util/time.hpp"

namespace offline::cache {

using offline::db::ThrowIfError;
using offline::worker::v1::HttpResponse;
using namespace offline::db::sqlite;

SqliteCacheStorage::SqliteCacheStorage(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  BootstrapSchema(*db_);
}

void SqliteCacheStorage::BootstrapSchema(SqliteDB& db) {
  db.Exec(
      "CREATE TABLE IF NOT EXISTS cache_generation ("
      "seq INTEGER PRIMARY KEY AUTOINCREMENT, "
      "name TEXT NOT NULL UNIQUE, "
      "created_at_ms INTEGER NOT NULL);");
  db.Exec(
      "CREATE TABLE IF NOT EXISTS cache_entry ("
      "generation TEXT NOT NULL REFERENCES cache_generation(name) ON DELETE CASCADE, "
      "request_key TEXT NOT NULL, "
      "response BLOB NOT NULL, "
      "stored_at_ms INTEGER NOT NULL, "
      "PRIMARY KEY (generation, request_key));");
}

void SqliteCacheStorage::OpenUnlocked(const std::string& generation) {
  auto st = db_->Prepare("INSERT OR IGNORE INTO cache_generation(name, created_at_ms) VALUES(?, ?);");
  BindText(st.get(), 1, generation);
  BindU64(st.get(), 2, offline::util::NowUnixMillis());
  ThrowIfError(db_->Translate(sqlite3_step(st.get())), "open generation " + generation);
}

void SqliteCacheStorage::InsertEntryUnlocked(const std::string& generation, const std::string& key, const HttpResponse& response) {
  auto st = db_->Prepare("INSERT OR REPLACE INTO cache_entry(generation, request_key, response, stored_at_ms) VALUES(?, ?, ?, ?);");
  BindText(st.get(), 1, generation);
  BindText(st.get(), 2, key);
  BindBlob(st.get(), 3, response.SerializeAsString());
  BindU64(st.get(), 4, offline::util::NowUnixMillis());
  ThrowIfError(db_->Translate(sqlite3_step(st.get())), "put " + key + " into " + generation);
}

void SqliteCacheStorage::Open(const std::string& generation) {
  auto lock = db_->Lock();
  OpenUnlocked(generation);
}

bool SqliteCacheStorage::Has(const std::string& generation) const {
  auto lock = db_->Lock();

  auto st = db_->Prepare("SELECT 1 FROM cache_generation WHERE name=?;");
  BindText(st.get(), 1, generation);

  int rc = sqlite3_step(st.get());
  ThrowIfError(db_->Translate(rc), "lookup generation " + generation);
  return rc == SQLITE_ROW;
}

std::vector<std::string> SqliteCacheStorage::Keys() const {
  auto lock = db_->Lock();

  auto st = db_->Prepare("SELECT name FROM cache_generation ORDER BY seq;");

  std::vector<std::string> names;
  int rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    names.push_back(ColText(st.get(), 0));
  }
  ThrowIfError(db_->Translate(rc), "list generations");
  return names;
}

bool SqliteCacheStorage::Delete(const std::string& generation) {
  auto lock = db_->Lock();
  SqliteTransaction tx(*db_);

  auto entries = db_->Prepare("DELETE FROM cache_entry WHERE generation=?;");
  BindText(entries.get(), 1, generation);
  ThrowIfError(db_->Translate(sqlite3_step(entries.get())), "delete entries of " + generation);

  auto st = db_->Prepare("DELETE FROM cache_generation WHERE name=?;");
  BindText(st.get(), 1, generation);
  ThrowIfError(db_->Translate(sqlite3_step(st.get())), "delete generation " + generation);
  const bool existed = sqlite3_changes(db_->Handle()) > 0;

  tx.Commit();
  return existed;
}

std::optional<HttpResponse> SqliteCacheStorage::Match(const std::string& generation, const std::string& key) const {
  auto lock = db_->Lock();

  auto st = db_->Prepare("SELECT response FROM cache_entry WHERE generation=? AND request_key=?;");
  BindText(st.get(), 1, generation);
  BindText(st.get(), 2, key);

  int rc = sqlite3_step(st.get());
  ThrowIfError(db_->Translate(rc), "match " + key + " in " + generation);
  if (rc != SQLITE_ROW) return std::nullopt;

  HttpResponse response;
  if (!response.ParseFromString(ColBlob(st.get(), 0))) {
    ThrowIfError(offline::db::Result::Err(offline::db::ErrorCode::Corruption, "unparseable response blob"), "match " + key);
  }
  return response;
}

void SqliteCacheStorage::Put(const std::string& generation, const std::string& key, const HttpResponse& response) {
  auto lock = db_->Lock();
  SqliteTransaction tx(*db_);
  OpenUnlocked(generation);
  InsertEntryUnlocked(generation, key, response);
  tx.Commit();
}

bool SqliteCacheStorage::PutExisting(const std::string& generation, const std::string& key, const HttpResponse& response) {
  // the connection lock is recursive; Has and the insert see the same state
  auto lock = db_->Lock();
  if (!Has(generation)) return false;

  InsertEntryUnlocked(generation, key, response);
  return true;
}

void SqliteCacheStorage::PutAll(const std::string& generation, const std::vector<std::pair<std::string, HttpResponse>>& entries) {
  auto lock = db_->Lock();
  SqliteTransaction tx(*db_);

  auto clear = db_->Prepare("DELETE FROM cache_entry WHERE generation=?;");
  BindText(clear.get(), 1, generation);
  ThrowIfError(db_->Translate(sqlite3_step(clear.get())), "reset generation " + generation);

  OpenUnlocked(generation);
  for (const auto& [key, response] : entries) {
    InsertEntryUnlocked(generation, key, response);
  }

  tx.Commit();
}

std::vector<std::string> SqliteCacheStorage::EntryKeys(const std::string& generation) const {
  auto lock = db_->Lock();

  auto st = db_->Prepare("SELECT request_key FROM cache_entry WHERE generation=? ORDER BY request_key;");
  BindText(st.get(), 1, generation);

  std::vector<std::string> keys;
  int rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    keys.push_back(ColText(st.get(), 0));
  }
  ThrowIfError(db_->Translate(rc), "list entries of " + generation);
  return keys;
}

std::size_t SqliteCacheStorage::DeleteMatching(const std::string& generation, const std::string& key_prefix) {
  auto lock = db_->Lock();

  // case-sensitive prefix match (LIKE folds ASCII case)
  auto st = db_->Prepare("DELETE FROM cache_entry WHERE generation=? AND substr(request_key, 1, ?)=?;");
  BindText(st.get(), 1, generation);
  BindU64(st.get(), 2, key_prefix.size());
  BindText(st.get(), 3, key_prefix);
  ThrowIfError(db_->Translate(sqlite3_step(st.get())), "invalidate " + key_prefix + " in " + generation);
  return static_cast<std::size_t>(sqlite3_changes(db_->Handle()));
}

} // namespace offline::cache

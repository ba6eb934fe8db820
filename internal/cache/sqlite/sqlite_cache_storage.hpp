#pragma once

#include <memory>

#include "internal/cache/cache_storage.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"

namespace offline::cache {

/*
  SQLITE cache backend.

  Tables:
    cache_generation(seq, name)
    cache_entry(generation, request_key, response, stored_at_ms)

  Responses are stored as serialized HttpResponse blobs.
*/

class SqliteCacheStorage final : public CacheStorage {
public:
  explicit SqliteCacheStorage(std::shared_ptr<offline::db::sqlite::SqliteDB> db);

  static void BootstrapSchema(offline::db::sqlite::SqliteDB& db);

  void Open(const std::string& generation) override;
  bool Has(const std::string& generation) const override;
  std::vector<std::string> Keys() const override;
  bool Delete(const std::string& generation) override;

  std::optional<offline::worker::v1::HttpResponse>
  Match(const std::string& generation, const std::string& key) const override;

  void Put(const std::string& generation,
           const std::string& key,
           const offline::worker::v1::HttpResponse& response) override;

  bool PutExisting(const std::string& generation,
                   const std::string& key,
                   const offline::worker::v1::HttpResponse& response) override;

  void PutAll(const std::string& generation,
              const std::vector<std::pair<std::string, offline::worker::v1::HttpResponse>>& entries) override;

  std::vector<std::string> EntryKeys(const std::string& generation) const override;

  std::size_t DeleteMatching(const std::string& generation, const std::string& key_prefix) override;

private:
  void OpenUnlocked(const std::string& generation);
  void InsertEntryUnlocked(const std::string& generation,
                           const std::string& key,
                           const offline::worker::v1::HttpResponse& response);

  std::shared_ptr<offline::db::sqlite::SqliteDB> db_;
};

} // namespace offline::cache

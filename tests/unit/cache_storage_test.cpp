#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "internal/cache/memory/memory_cache_storage.hpp"
#include "internal/cache/request_key.hpp"
#include "internal/cache/sqlite/sqlite_cache_storage.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"

namespace {

using offline::cache::CacheStoragePtr;
using offline::worker::v1::HttpResponse;

HttpResponse MakeResponse(uint32_t status, const std::string& body) {
  HttpResponse response;
  response.set_status(status);
  response.set_body(body);
  auto* header = response.add_headers();
  header->set_name("Content-Type");
  header->set_value("text/html");
  return response;
}

std::string TempDbPath(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "offline_worker_cache_storage_tests";
  std::filesystem::create_directories(dir);
  const auto path = dir / (name + ".db");
  std::filesystem::remove(path);
  std::filesystem::remove(path.string() + "-wal");
  std::filesystem::remove(path.string() + "-shm");
  return path.string();
}

void TestGenerationsKeepCreationOrder(const CacheStoragePtr& storage) {
  storage->Open("static@v1");
  storage->Open("dynamic@v1");
  storage->Open("static@v1");

  const auto keys = storage->Keys();
  assert(keys.size() == 2);
  assert(keys[0] == "static@v1");
  assert(keys[1] == "dynamic@v1");
  assert(storage->Has("dynamic@v1"));
  assert(!storage->Has("dynamic@v2"));
}

void TestPutReplacesAndMatchIsByteForByte(const CacheStoragePtr& storage) {
  const std::string body("binary\0payload", 14);
  storage->Put("dynamic@v1", "GET http://app.local/logo.png", MakeResponse(200, "old"));
  storage->Put("dynamic@v1", "GET http://app.local/logo.png", MakeResponse(200, body));

  const auto hit = storage->Match("dynamic@v1", "GET http://app.local/logo.png");
  assert(hit.has_value());
  assert(hit->status() == 200);
  assert(hit->body() == body);
  assert(hit->headers_size() == 1);
  assert(hit->headers(0).value() == "text/html");

  assert(!storage->Match("dynamic@v1", "GET http://app.local/missing").has_value());
  assert(!storage->Match("nope@v1", "GET http://app.local/logo.png").has_value());
}

void TestPutCreatesMissingGeneration(const CacheStoragePtr& storage) {
  storage->Put("dynamic@v9", "GET http://app.local/a", MakeResponse(200, "a"));
  assert(storage->Has("dynamic@v9"));
  assert(storage->Delete("dynamic@v9"));
  assert(!storage->Delete("dynamic@v9"));
  assert(!storage->Has("dynamic@v9"));
}

void TestPutExistingNeverRecreatesDeletedGeneration(const CacheStoragePtr& storage) {
  assert(!storage->PutExisting("dynamic@v4", "GET http://app.local/a", MakeResponse(200, "a")));
  assert(!storage->Has("dynamic@v4"));

  storage->Open("dynamic@v4");
  assert(storage->PutExisting("dynamic@v4", "GET http://app.local/a", MakeResponse(200, "a")));
  assert(storage->Match("dynamic@v4", "GET http://app.local/a")->body() == "a");

  assert(storage->Delete("dynamic@v4"));
  assert(!storage->PutExisting("dynamic@v4", "GET http://app.local/b", MakeResponse(200, "b")));
  assert(!storage->Has("dynamic@v4"));
  assert(storage->EntryKeys("dynamic@v4").empty());
}

void TestPutAllReplacesWholeGeneration(const CacheStoragePtr& storage) {
  storage->Put("static@v2", "GET http://app.local/stale", MakeResponse(200, "stale"));

  storage->PutAll("static@v2", {{"GET http://app.local/", MakeResponse(200, "root")},
                                {"GET http://app.local/offline", MakeResponse(200, "offline")}});

  const auto keys = storage->EntryKeys("static@v2");
  assert(keys.size() == 2);
  assert(!storage->Match("static@v2", "GET http://app.local/stale").has_value());
  assert(storage->Match("static@v2", "GET http://app.local/offline")->body() == "offline");
}

void TestDeleteMatchingIsCaseSensitivePrefix(const CacheStoragePtr& storage) {
  const auto origin = offline::util::ParseAbsoluteUrl("http://app.local");
  storage->Put("dynamic@v3", "GET http://app.local/api/v1/mail/list", MakeResponse(200, "list"));
  storage->Put("dynamic@v3", "GET http://app.local/api/v1/mail/42", MakeResponse(200, "42"));
  storage->Put("dynamic@v3", "GET http://app.local/API/V1/MAIL/x", MakeResponse(200, "upper"));
  storage->Put("dynamic@v3", "GET http://app.local/api/v1/calendar/day", MakeResponse(200, "day"));

  const auto dropped = storage->DeleteMatching("dynamic@v3", offline::cache::RequestKeyPrefix(origin, "/api/v1/mail"));
  assert(dropped == 2);
  assert(storage->Match("dynamic@v3", "GET http://app.local/API/V1/MAIL/x").has_value());
  assert(storage->Match("dynamic@v3", "GET http://app.local/api/v1/calendar/day").has_value());
  assert(storage->DeleteMatching("missing@v1", "GET ") == 0);
}

void RunAll(const CacheStoragePtr& storage) {
  TestGenerationsKeepCreationOrder(storage);
  TestPutReplacesAndMatchIsByteForByte(storage);
  TestPutCreatesMissingGeneration(storage);
  TestPutExistingNeverRecreatesDeletedGeneration(storage);
  TestPutAllReplacesWholeGeneration(storage);
  TestDeleteMatchingIsCaseSensitivePrefix(storage);
}

void TestSqliteEntriesSurviveReopen() {
  const auto path = TempDbPath("reopen");
  {
    auto storage = std::make_shared<offline::cache::SqliteCacheStorage>(std::make_shared<offline::db::sqlite::SqliteDB>(path));
    storage->Put("dynamic@v1", "GET http://app.local/mail", MakeResponse(200, "mail"));
  }

  auto storage = std::make_shared<offline::cache::SqliteCacheStorage>(std::make_shared<offline::db::sqlite::SqliteDB>(path));
  assert(storage->Has("dynamic@v1"));
  assert(storage->Match("dynamic@v1", "GET http://app.local/mail")->body() == "mail");
}

} // namespace

int main() {
  RunAll(std::make_shared<offline::cache::MemoryCacheStorage>());
  RunAll(std::make_shared<offline::cache::SqliteCacheStorage>(std::make_shared<offline::db::sqlite::SqliteDB>(TempDbPath("parity"))));
  TestSqliteEntriesSurviveReopen();

  std::cout << "offline_worker_unit_cache_storage: pass\n";
  return 0;
}

#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "internal/cache/memory/memory_cache_storage.hpp"
#include "internal/cache/request_key.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/sync/memory/memory_sync_store.hpp"
#include "internal/sync/outbox.hpp"
#include "internal/sync/sqlite/sqlite_sync_store.hpp"
#include "internal/sync/sync_runner.hpp"
#include "internal/util/errors.hpp"
#include "support/fake_fetcher.hpp"

namespace {

using offline::sync::Outbox;
using offline::sync::SyncRunner;
using namespace offline::worker::v1;

constexpr const char* kOrigin = "http://app.local";

offline::runtime::config::OutboxConfig OutboxSettings(bool enabled) {
  offline::runtime::config::OutboxConfig config;
  config.set_enabled(enabled);
  config.set_tag("mail-outbox");
  config.add_prefixes("/api/v1/mail");
  return config;
}

std::vector<offline::runtime::config::SyncTaskConfig> Tasks() {
  offline::runtime::config::SyncTaskConfig mail;
  mail.set_tag("sync-mail");
  mail.set_path("/api/v1/mail/sync");
  mail.add_invalidate_prefixes("/api/v1/mail");
  return {mail};
}

struct Harness {
  std::shared_ptr<offline::test::FakeFetcher>         fetcher = std::make_shared<offline::test::FakeFetcher>();
  std::shared_ptr<offline::cache::MemoryCacheStorage> cache   = std::make_shared<offline::cache::MemoryCacheStorage>();
  std::shared_ptr<offline::sync::MemorySyncStore>     store   = std::make_shared<offline::sync::MemorySyncStore>();
  std::shared_ptr<Outbox>                             outbox;
  std::unique_ptr<SyncRunner>                         runner;

  explicit Harness(bool outbox_enabled = true) {
    outbox = std::make_shared<Outbox>(store, fetcher, OutboxSettings(outbox_enabled));
    runner = std::make_unique<SyncRunner>(fetcher, store, cache, outbox, offline::util::ParseAbsoluteUrl(kOrigin), Tasks());
  }
};

std::string Key(const std::string& path) {
  return offline::cache::RequestKey("GET", offline::util::ParseAbsoluteUrl(std::string(kOrigin) + path));
}

HttpRequest Post(const std::string& path, const std::string& body) {
  HttpRequest request;
  request.set_method("POST");
  request.set_url(std::string(kOrigin) + path);
  request.set_body(body);
  return request;
}

void TestRegisterUnboundTagIsRejected() {
  Harness h;
  bool    threw = false;
  try {
    h.runner->Register("sync-unknown");
  } catch (const offline::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
  assert(h.runner->PendingTags().empty());
}

void TestRunUnboundTagIsNotFound() {
  Harness h;
  bool    threw = false;
  try {
    h.runner->Run("sync-unknown", "dynamic@v1");
  } catch (const offline::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestSuccessfulSyncRemovesTagAndInvalidates() {
  Harness h;
  HttpResponse cached;
  cached.set_status(200);
  cached.set_body("stale inbox");
  h.cache->Put("dynamic@v1", Key("/api/v1/mail/list"), cached);
  h.cache->Put("dynamic@v1", Key("/api/v1/calendar/day"), cached);

  h.fetcher->Respond("http://app.local/api/v1/mail/sync", 200, "{}", "application/json");
  h.runner->Register("sync-mail");
  h.runner->Register("sync-mail");
  assert(h.runner->PendingTags().size() == 1);

  h.runner->Run("sync-mail", "dynamic@v1");

  assert(h.runner->PendingTags().empty());
  assert(h.fetcher->Calls("POST", "http://app.local/api/v1/mail/sync") == 1);
  assert(!h.cache->Match("dynamic@v1", Key("/api/v1/mail/list")).has_value());
  assert(h.cache->Match("dynamic@v1", Key("/api/v1/calendar/day")).has_value());
}

void TestFailedSyncKeepsTag() {
  Harness h;
  h.fetcher->Unreachable("http://app.local/api/v1/mail/sync");
  h.runner->Register("sync-mail");

  bool threw = false;
  try {
    h.runner->Run("sync-mail", "dynamic@v1");
  } catch (const offline::util::SyncFailed&) {
    threw = true;
  }
  assert(threw);
  assert(h.runner->PendingTags().size() == 1);

  // an HTTP error is a failure too
  h.fetcher->Reachable("http://app.local/api/v1/mail/sync");
  h.fetcher->Respond("http://app.local/api/v1/mail/sync", 502, "bad gateway");
  threw = false;
  try {
    h.runner->Run("sync-mail", "dynamic@v1");
  } catch (const offline::util::SyncFailed&) {
    threw = true;
  }
  assert(threw);
  assert(h.runner->PendingTags().size() == 1);
}

void TestOutboxCapturesOnlyMutationsUnderPrefix() {
  Harness h;
  const auto mail = offline::util::ParseAbsoluteUrl("http://app.local/api/v1/mail/send");
  const auto docs = offline::util::ParseAbsoluteUrl("http://app.local/api/v1/docs/save");
  assert(h.outbox->Captures("POST", mail));
  assert(!h.outbox->Captures("GET", mail));
  assert(!h.outbox->Captures("POST", docs));

  Harness disabled(/*outbox_enabled=*/false);
  assert(!disabled.outbox->Captures("POST", mail));
  assert(!disabled.runner->Knows("mail-outbox"));
}

void TestCaptureAnswers202AndRegistersTag() {
  Harness h;
  const auto response = h.outbox->Capture(Post("/api/v1/mail/send", R"({"to":"ana"})"));
  assert(response.status() == 202);
  assert(response.source() == RESPONSE_SOURCE_OUTBOX);
  assert(response.body().find(R"("queued":true)") != std::string::npos);
  assert(response.body().find("Action queued for when you are back online.") != std::string::npos);
  assert(response.body().find(R"("actionId":")") != std::string::npos);

  assert(h.outbox->Size() == 1);
  assert(h.store->HasTag("mail-outbox"));
}

void TestReplaySendsInOrderAndKeepsFailures() {
  Harness h;
  h.outbox->Capture(Post("/api/v1/mail/send", "first"));
  h.outbox->Capture(Post("/api/v1/mail/archive", "second"));
  h.outbox->Capture(Post("/api/v1/mail/send", "third"));

  h.fetcher->Respond("http://app.local/api/v1/mail/send", 200, "ok");
  h.fetcher->Unreachable("http://app.local/api/v1/mail/archive");

  bool threw = false;
  try {
    h.runner->Run("mail-outbox", "dynamic@v1");
  } catch (const offline::util::SyncFailed&) {
    threw = true;
  }
  assert(threw);
  assert(h.store->HasTag("mail-outbox"));

  const auto remaining = h.store->ListActions();
  assert(remaining.size() == 1);
  assert(remaining[0].body() == "second");

  h.fetcher->Reachable("http://app.local/api/v1/mail/archive");
  h.fetcher->Respond("http://app.local/api/v1/mail/archive", 200, "ok");
  h.runner->Run("mail-outbox", "dynamic@v1");
  assert(h.outbox->Size() == 0);
  assert(!h.store->HasTag("mail-outbox"));
}

void TestSqliteSyncStoreSurvivesReopen() {
  const auto dir = std::filesystem::temp_directory_path() / "offline_worker_sync_tests";
  std::filesystem::create_directories(dir);
  const auto path = (dir / "sync.db").string();
  std::filesystem::remove(path);
  std::filesystem::remove(path + "-wal");
  std::filesystem::remove(path + "-shm");

  {
    auto db = std::make_shared<offline::db::sqlite::SqliteDB>(path);
    offline::sync::SqliteSyncStore store(db);

    assert(store.RegisterTag("sync-mail"));
    assert(!store.RegisterTag("sync-mail"));
    assert(store.RegisterTag("sync-calendar"));

    QueuedAction a;
    a.set_id("a-1");
    a.set_method("POST");
    a.set_url("http://app.local/api/v1/mail/send");
    a.set_body(std::string("bin\0ary", 7));
    store.EnqueueAction(a);

    QueuedAction b = a;
    b.set_id("a-2");
    store.EnqueueAction(b);
  }

  auto db = std::make_shared<offline::db::sqlite::SqliteDB>(path);
  offline::sync::SqliteSyncStore store(db);

  const auto tags = store.PendingTags();
  assert(tags.size() == 2);
  assert(tags[0] == "sync-mail");
  assert(tags[1] == "sync-calendar");

  const auto actions = store.ListActions();
  assert(actions.size() == 2);
  assert(actions[0].id() == "a-1");
  assert(actions[0].body() == std::string("bin\0ary", 7));

  assert(store.RemoveAction("a-1"));
  assert(!store.RemoveAction("a-1"));
  assert(store.QueuedActions() == 1);
  assert(store.RemoveTag("sync-mail"));
  assert(!store.HasTag("sync-mail"));
}

} // namespace

int main() {
  TestRegisterUnboundTagIsRejected();
  TestRunUnboundTagIsNotFound();
  TestSuccessfulSyncRemovesTagAndInvalidates();
  TestFailedSyncKeepsTag();
  TestOutboxCapturesOnlyMutationsUnderPrefix();
  TestCaptureAnswers202AndRegistersTag();
  TestReplaySendsInOrderAndKeepsFailures();
  TestSqliteSyncStoreSurvivesReopen();

  std::cout << "offline_worker_unit_sync_runner: pass\n";
  return 0;
}

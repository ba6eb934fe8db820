#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/cache/memory/memory_cache_storage.hpp"
#include "internal/cache/request_key.hpp"
#include "internal/cache/write_back_queue.hpp"
#include "internal/cache/write_back_worker.hpp"
#include "internal/clients/client_registry.hpp"
#include "internal/lifecycle/lifecycle_manager.hpp"
#include "internal/util/errors.hpp"
#include "support/failing_cache_storage.hpp"
#include "support/fake_fetcher.hpp"

namespace {

using offline::lifecycle::LifecycleManager;
using offline::lifecycle::LifecycleOptions;
using offline::lifecycle::LifecycleState;

constexpr const char* kOrigin = "http://app.local";

struct Harness {
  std::shared_ptr<offline::test::FakeFetcher>         fetcher = std::make_shared<offline::test::FakeFetcher>();
  offline::cache::CacheStoragePtr                     storage;
  std::shared_ptr<offline::clients::ClientRegistry>   clients;
  std::unique_ptr<LifecycleManager>                   lifecycle;

  explicit Harness(bool                            skip_waiting = false,
                   offline::cache::CacheStoragePtr backing      = std::make_shared<offline::cache::MemoryCacheStorage>())
      : storage(std::move(backing)) {
    clients = std::make_shared<offline::clients::ClientRegistry>(offline::util::ParseAbsoluteUrl(kOrigin));

    LifecycleOptions options;
    options.static_prefix  = "static";
    options.dynamic_prefix = "dynamic";
    options.precache       = {"/", "/dashboard", "/offline"};
    options.skip_waiting   = skip_waiting;

    for (const auto& path : options.precache) {
      fetcher->Respond(std::string(kOrigin) + path, 200, "<html>" + path + "</html>");
    }

    lifecycle = std::make_unique<LifecycleManager>(storage, fetcher, clients, offline::util::ParseAbsoluteUrl(kOrigin), options);
  }
};

std::string Key(const std::string& path) {
  return offline::cache::RequestKey("GET", offline::util::ParseAbsoluteUrl(std::string(kOrigin) + path));
}

void TestFirstInstallPrewarmsAndActivates() {
  Harness h;
  const auto version = h.lifecycle->Install(1);
  assert(version.state == LifecycleState::kActive);

  assert(h.storage->Has("static@v1"));
  assert(h.storage->Has("dynamic@v1"));
  assert(h.storage->EntryKeys("static@v1").size() == 3);
  assert(h.storage->Match("static@v1", Key("/offline"))->body() == "<html>/offline</html>");

  const auto generations = h.lifecycle->CurrentGenerations();
  assert(generations.static_name == "static@v1");
  assert(generations.dynamic_name == "dynamic@v1");
}

void TestVersionZeroInstallsDefault() {
  Harness h;
  const auto version = h.lifecycle->Install(0);
  assert(version.version == 1);
  assert(version.static_generation == "static@v1");
}

void TestFailedAssetAbandonsInstall() {
  Harness h;
  h.fetcher->Unreachable("http://app.local/dashboard");

  bool threw = false;
  try {
    h.lifecycle->Install(1);
  } catch (const offline::util::InstallFailed&) {
    threw = true;
  }
  assert(threw);
  assert(!h.storage->Has("static@v1"));
  assert(!h.lifecycle->HasActive());

  const auto snapshot = h.lifecycle->Snapshot();
  assert(snapshot.latest.has_value());
  assert(snapshot.latest->state == LifecycleState::kRedundant);
}

void TestNonOkAssetAbandonsInstall() {
  Harness h;
  h.fetcher->Respond("http://app.local/dashboard", 500, "boom");

  bool threw = false;
  try {
    h.lifecycle->Install(1);
  } catch (const offline::util::InstallFailed&) {
    threw = true;
  }
  assert(threw);
  assert(h.storage->Keys().empty());
}

void TestSecondVersionWaitsThenActivatesAndCleansUp() {
  Harness h;
  h.lifecycle->Install(1);

  offline::worker::v1::HttpResponse cached;
  cached.set_status(200);
  cached.set_body("mail list");
  h.storage->Put("dynamic@v1", Key("/api/v1/mail/list"), cached);

  const auto v2 = h.lifecycle->Install(2);
  assert(v2.state == LifecycleState::kInstalled);

  auto snapshot = h.lifecycle->Snapshot();
  assert(snapshot.active->version == 1);
  assert(snapshot.waiting->version == 2);
  assert(h.lifecycle->CurrentGenerations().static_name == "static@v1");

  assert(h.lifecycle->ActivateWaiting());
  snapshot = h.lifecycle->Snapshot();
  assert(snapshot.active->version == 2);
  assert(!snapshot.waiting.has_value());

  const auto names = h.storage->Keys();
  assert(names.size() == 2);
  assert(h.storage->Has("static@v2"));
  assert(h.storage->Has("dynamic@v2"));
  assert(!h.storage->Has("dynamic@v1"));
}

void TestActivateWithoutWaitingIsNoOp() {
  Harness h;
  assert(!h.lifecycle->ActivateWaiting());
  h.lifecycle->Install(1);
  assert(!h.lifecycle->ActivateWaiting());
}

void TestSkipWaitingActivatesImmediately() {
  Harness h(/*skip_waiting=*/true);
  h.lifecycle->Install(1);
  const auto v2 = h.lifecycle->Install(2);
  assert(v2.state == LifecycleState::kActive);
  assert(h.lifecycle->CurrentGenerations().dynamic_name == "dynamic@v2");
  assert(!h.storage->Has("static@v1"));
}

void TestSupersededWaitingVersionBecomesRedundant() {
  Harness h;
  h.lifecycle->Install(1);
  h.lifecycle->Install(2);
  h.lifecycle->Install(3);

  const auto snapshot = h.lifecycle->Snapshot();
  assert(snapshot.active->version == 1);
  assert(snapshot.waiting->version == 3);

  h.lifecycle->ActivateWaiting();
  // v2's generations were written but never served; activation removes them
  assert(!h.storage->Has("static@v2"));
  assert(h.lifecycle->CurrentGenerations().static_name == "static@v3");
}

void TestActivationClaimsClients() {
  Harness h;
  const auto window = h.clients->Register("/mail", /*controlled=*/false);
  assert(!h.clients->IsControlled(window.id()));

  h.lifecycle->Install(1);
  assert(h.clients->IsControlled(window.id()));
}

void TestPurgeAllThenReinstall() {
  Harness h;
  h.lifecycle->Install(1);
  const auto keys_before = h.storage->EntryKeys("static@v1");
  std::vector<std::string> bodies_before;
  for (const auto& key : keys_before) bodies_before.push_back(h.storage->Match("static@v1", key)->body());

  assert(h.lifecycle->PurgeAll() == 2);
  assert(h.storage->Keys().empty());

  const auto version = h.lifecycle->Install(1);
  assert(version.state == LifecycleState::kActive);
  assert(h.storage->Keys() == std::vector<std::string>({"static@v1", "dynamic@v1"}));

  const auto keys_after = h.storage->EntryKeys("static@v1");
  assert(keys_after == keys_before);
  assert(keys_after.size() == 3);
  for (std::size_t i = 0; i < keys_after.size(); ++i) {
    assert(h.storage->Match("static@v1", keys_after[i])->body() == bodies_before[i]);
  }
  assert(h.storage->EntryKeys("dynamic@v1").empty());
}

void TestReinstallingActiveVersionIsRejected() {
  Harness h;
  h.lifecycle->Install(1);

  // a new deploy changed the asset behind the same version number
  h.fetcher->Respond("http://app.local/dashboard", 200, "<html>rebuilt</html>");

  bool threw = false;
  try {
    h.lifecycle->Install(1);
  } catch (const offline::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
  assert(h.storage->Match("static@v1", Key("/dashboard"))->body() == "<html>/dashboard</html>");

  const auto snapshot = h.lifecycle->Snapshot();
  assert(snapshot.active->version == 1);
  assert(snapshot.active->state == LifecycleState::kActive);
  assert(snapshot.latest->state == LifecycleState::kActive);
  assert(!snapshot.waiting.has_value());
}

void TestLateWriteBackAfterActivationIsDiscarded() {
  Harness h(/*skip_waiting=*/true);
  h.lifecycle->Install(1);

  offline::worker::v1::HttpResponse snapshot;
  snapshot.set_status(200);
  snapshot.set_body("mail list");

  // a cache-first miss under v1 queues its write; activation of v2 wins the race
  auto write_back = std::make_shared<offline::cache::WriteBackQueue>();
  write_back->Enqueue({h.lifecycle->CurrentGenerations().dynamic_name, Key("/api/v1/mail/list"), snapshot});
  h.lifecycle->Install(2);

  offline::cache::WriteBackWorker writer(write_back, h.storage);
  writer.Start();
  write_back->Flush();
  writer.Stop();

  assert(h.storage->Keys() == std::vector<std::string>({"static@v2", "dynamic@v2"}));
  assert(h.storage->EntryKeys("dynamic@v2").empty());
}

void TestDeleteFailureDoesNotBlockActivation() {
  auto storage = std::make_shared<offline::test::FailingCacheStorage>();
  Harness h(/*skip_waiting=*/true, storage);
  h.lifecycle->Install(1);

  storage->fail_deletes = true;
  const auto v2 = h.lifecycle->Install(2);
  assert(v2.state == LifecycleState::kActive);
  assert(h.lifecycle->CurrentGenerations().static_name == "static@v2");

  // the old pair is left behind, not served
  assert(storage->Has("static@v1"));
  assert(storage->Has("dynamic@v1"));
  assert(storage->Keys().size() == 4);

  storage->fail_deletes = false;
  h.lifecycle->Install(3);
  assert(storage->Keys() == std::vector<std::string>({"static@v3", "dynamic@v3"}));
}

void TestStateTransitions() {
  using offline::lifecycle::CanTransition;
  assert(CanTransition(LifecycleState::kInstalling, LifecycleState::kInstalled));
  assert(CanTransition(LifecycleState::kInstalled, LifecycleState::kRedundant));
  assert(!CanTransition(LifecycleState::kInstalling, LifecycleState::kActive));
  assert(!CanTransition(LifecycleState::kRedundant, LifecycleState::kInstalling));
  assert(!CanTransition(LifecycleState::kActive, LifecycleState::kInstalled));
}

} // namespace

int main() {
  TestFirstInstallPrewarmsAndActivates();
  TestVersionZeroInstallsDefault();
  TestFailedAssetAbandonsInstall();
  TestNonOkAssetAbandonsInstall();
  TestSecondVersionWaitsThenActivatesAndCleansUp();
  TestActivateWithoutWaitingIsNoOp();
  TestSkipWaitingActivatesImmediately();
  TestSupersededWaitingVersionBecomesRedundant();
  TestActivationClaimsClients();
  TestPurgeAllThenReinstall();
  TestReinstallingActiveVersionIsRejected();
  TestLateWriteBackAfterActivationIsDiscarded();
  TestDeleteFailureDoesNotBlockActivation();
  TestStateTransitions();

  std::cout << "offline_worker_unit_lifecycle_manager: pass\n";
  return 0;
}

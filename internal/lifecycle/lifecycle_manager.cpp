#include "lifecycle_manager.hpp"

#include "internal/cache/request_key.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace offline::lifecycle {

using offline::observability::IntField;
using offline::observability::StringField;

const char* ToString(LifecycleState state) {
  switch (state) {
    case LifecycleState::kInstalling:
      return "installing";
    case LifecycleState::kInstalled:
      return "installed";
    case LifecycleState::kActivating:
      return "activating";
    case LifecycleState::kActive:
      return "active";
    case LifecycleState::kRedundant:
      return "redundant";
    default:
      return "unspecified";
  }
}

LifecycleManager::LifecycleManager(offline::cache::CacheStoragePtr                  storage,
                                   offline::net::FetcherPtr                         fetcher,
                                   std::shared_ptr<offline::clients::ClientRegistry> clients,
                                   offline::util::Url                               origin,
                                   LifecycleOptions                                 options)
    : storage_(std::move(storage)),
      fetcher_(std::move(fetcher)),
      clients_(std::move(clients)),
      origin_(std::move(origin)),
      options_(std::move(options)) {
}

std::string LifecycleManager::GenerationName(const std::string& prefix, uint32_t version) {
  return prefix + "@v" + std::to_string(version);
}

WorkerVersion LifecycleManager::Install(uint32_t version) {
  std::lock_guard install_lock(install_mutex_);

  if (version == 0) version = options_.default_version;

  // the live static generation is never rewritten under running clients;
  // reinstalling the active version is only allowed once it was purged
  bool repairs_active = false;
  {
    std::lock_guard lock(mutex_);
    repairs_active = active_ && active_->version == version;
  }
  if (repairs_active && storage_->Has(GenerationName(options_.static_prefix, version))) {
    OFFLINE_LOG_WARN("install rejected; version is active", {IntField("version", version)});
    throw offline::util::InvalidState("install v" + std::to_string(version) + ": version is already active");
  }

  WorkerVersion candidate;
  candidate.version            = version;
  candidate.static_generation  = GenerationName(options_.static_prefix, version);
  candidate.dynamic_generation = GenerationName(options_.dynamic_prefix, version);
  candidate.state              = LifecycleState::kInstalling;
  {
    std::lock_guard lock(mutex_);
    latest_ = candidate;
  }

  OFFLINE_LOG_INFO("install started", {IntField("version", version), IntField("assets", static_cast<int64_t>(options_.precache.size()))});

  // pre-warm into memory first: nothing is written unless every asset arrives
  std::vector<std::pair<std::string, offline::worker::v1::HttpResponse>> entries;
  try {
    for (const auto& asset : options_.precache) {
      const auto url = offline::util::ResolveUrl(asset, origin_);

      offline::worker::v1::HttpRequest request;
      request.set_method("GET");
      request.set_url(url.ToString());

      auto response = fetcher_->Fetch(request);
      if (!offline::net::IsOk(response)) {
        throw offline::util::NetworkError("status " + std::to_string(response.status()) + " for " + url.ToString());
      }
      response.clear_source();
      entries.emplace_back(offline::cache::RequestKey("GET", url), std::move(response));
    }

    storage_->PutAll(candidate.static_generation, entries);
    storage_->Open(candidate.dynamic_generation);
  } catch (const std::exception& e) {
    std::lock_guard lock(mutex_);
    SetState(&*latest_, LifecycleState::kRedundant);
    OFFLINE_LOG_ERROR("install failed", {IntField("version", version), StringField("error", e.what())});
    throw offline::util::InstallFailed("install v" + std::to_string(version) + ": " + e.what());
  }

  std::lock_guard lock(mutex_);
  SetState(&*latest_, LifecycleState::kInstalled);

  if (waiting_) {
    SetState(&*waiting_, LifecycleState::kRedundant);
    OFFLINE_LOG_INFO("waiting version superseded", {IntField("version", waiting_->version)});
  }
  waiting_ = *latest_;

  if (!active_ || options_.skip_waiting || repairs_active) {
    ActivateUnlocked();
  }
  return *latest_;
}

bool LifecycleManager::ActivateWaiting() {
  std::lock_guard install_lock(install_mutex_);
  std::lock_guard lock(mutex_);
  if (!waiting_) {
    OFFLINE_LOG_DEBUG("activate requested without a waiting version");
    return false;
  }
  ActivateUnlocked();
  return true;
}

void LifecycleManager::ActivateUnlocked() {
  WorkerVersion next = *waiting_;
  waiting_.reset();

  SetState(&next, LifecycleState::kActivating);
  if (latest_ && latest_->version == next.version) latest_->state = next.state;

  DeleteStaleGenerations(next);

  SetState(&next, LifecycleState::kActive);
  if (latest_ && latest_->version == next.version) latest_->state = next.state;

  const auto previous = active_;
  active_             = next;

  const auto claimed = clients_->Claim();
  OFFLINE_LOG_INFO("version activated",
                   {IntField("version", next.version), IntField("previous", previous ? previous->version : 0),
                    IntField("claimed_clients", static_cast<int64_t>(claimed))});
}

void LifecycleManager::DeleteStaleGenerations(const WorkerVersion& current) {
  std::vector<std::string> names;
  try {
    names = storage_->Keys();
  } catch (const offline::util::StorageError& e) {
    OFFLINE_LOG_WARN("generation listing failed", {StringField("error", e.what())});
    return;
  }

  for (const auto& name : names) {
    if (name == current.static_generation || name == current.dynamic_generation) continue;
    try {
      storage_->Delete(name);
      OFFLINE_LOG_DEBUG("generation deleted", {StringField("generation", name)});
    } catch (const offline::util::StorageError& e) {
      OFFLINE_LOG_WARN("generation delete failed", {StringField("generation", name), StringField("error", e.what())});
    }
  }
}

std::size_t LifecycleManager::PurgeAll() {
  std::size_t deleted = 0;
  for (const auto& name : storage_->Keys()) {
    if (storage_->Delete(name)) ++deleted;
  }
  OFFLINE_LOG_INFO("all generations purged", {IntField("deleted", static_cast<int64_t>(deleted))});
  return deleted;
}

strategy::Generations LifecycleManager::CurrentGenerations() const {
  std::lock_guard lock(mutex_);
  if (!active_) return {};
  return {active_->static_generation, active_->dynamic_generation};
}

bool LifecycleManager::HasActive() const {
  std::lock_guard lock(mutex_);
  return active_.has_value();
}

LifecycleSnapshot LifecycleManager::Snapshot() const {
  std::lock_guard lock(mutex_);
  return {active_, waiting_, latest_};
}

void LifecycleManager::SetState(WorkerVersion* version, LifecycleState to) {
  if (!CanTransition(version->state, to)) {
    throw offline::util::InvalidState(std::string("lifecycle: illegal transition ") + ToString(version->state) + " -> " + ToString(to));
  }
  version->state = to;
}

} // namespace offline::lifecycle

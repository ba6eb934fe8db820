#include "sync_runner.hpp"

#include "internal/cache/request_key.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace offline::sync {

using offline::observability::IntField;
using offline::observability::StringField;

SyncRunner::SyncRunner(offline::net::FetcherPtr                                     fetcher,
                       SyncStorePtr                                                 store,
                       offline::cache::CacheStoragePtr                              cache,
                       std::shared_ptr<Outbox>                                      outbox,
                       offline::util::Url                                           origin,
                       const std::vector<offline::runtime::config::SyncTaskConfig>& tasks)
    : fetcher_(std::move(fetcher)),
      store_(std::move(store)),
      cache_(std::move(cache)),
      outbox_(std::move(outbox)),
      origin_(std::move(origin)) {
  for (const auto& task : tasks) {
    tasks_[task.tag()] = task;
  }
}

bool SyncRunner::Knows(const std::string& tag) const {
  if (tasks_.count(tag)) return true;
  return outbox_ && outbox_->Enabled() && outbox_->Tag() == tag;
}

void SyncRunner::Register(const std::string& tag) {
  if (!Knows(tag)) {
    throw offline::util::InvalidArgument("sync tag not bound: " + tag);
  }
  if (store_->RegisterTag(tag)) {
    OFFLINE_LOG_INFO("sync registered", {StringField("tag", tag)});
  }
}

void SyncRunner::Run(const std::string& tag, const std::string& dynamic_generation) {
  if (!Knows(tag)) {
    throw offline::util::NotFound("sync tag not bound: " + tag);
  }

  const auto task = tasks_.find(tag);
  if (task != tasks_.end()) {
    RunTask(task->second, dynamic_generation);
    return;
  }

  const auto remaining = outbox_->Replay();
  if (remaining > 0) {
    offline::observability::Metrics::Instance().RecordSyncOutcome(tag, false);
    throw offline::util::SyncFailed("sync " + tag + ": " + std::to_string(remaining) + " action(s) still queued");
  }
  store_->RemoveTag(tag);
  offline::observability::Metrics::Instance().RecordSyncOutcome(tag, true);
}

void SyncRunner::RunTask(const offline::runtime::config::SyncTaskConfig& task, const std::string& dynamic_generation) {
  offline::worker::v1::HttpRequest request;
  request.set_method("POST");
  request.set_url(offline::util::ResolveUrl(task.path(), origin_).ToString());
  auto* content_type = request.add_headers();
  content_type->set_name("Content-Type");
  content_type->set_value("application/json");

  std::string failure;
  try {
    const auto response = fetcher_->Fetch(request);
    if (!offline::net::IsOk(response)) {
      failure = "status " + std::to_string(response.status());
    }
  } catch (const offline::util::NetworkError& e) {
    failure = e.what();
  }

  if (!failure.empty()) {
    offline::observability::Metrics::Instance().RecordSyncOutcome(task.tag(), false);
    OFFLINE_LOG_WARN("sync failed", {StringField("tag", task.tag()), StringField("error", failure)});
    throw offline::util::SyncFailed("sync " + task.tag() + ": " + failure);
  }

  store_->RemoveTag(task.tag());
  Invalidate(task, dynamic_generation);

  offline::observability::Metrics::Instance().RecordSyncOutcome(task.tag(), true);
  OFFLINE_LOG_INFO("sync completed", {StringField("tag", task.tag())});
}

void SyncRunner::Invalidate(const offline::runtime::config::SyncTaskConfig& task, const std::string& dynamic_generation) {
  if (dynamic_generation.empty()) return;

  for (const auto& prefix : task.invalidate_prefixes()) {
    try {
      const auto dropped = cache_->DeleteMatching(dynamic_generation, offline::cache::RequestKeyPrefix(origin_, prefix));
      OFFLINE_LOG_DEBUG("sync invalidated entries", {StringField("prefix", prefix), IntField("dropped", static_cast<int64_t>(dropped))});
    } catch (const offline::util::StorageError& e) {
      OFFLINE_LOG_WARN("sync invalidation failed", {StringField("prefix", prefix), StringField("error", e.what())});
    }
  }
}

std::vector<std::string> SyncRunner::PendingTags() const {
  return store_->PendingTags();
}

} // namespace offline::sync

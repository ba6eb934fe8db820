#include "outbox.hpp"

#include <google/protobuf/util/json_util.h>

#include "internal/net/headers.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace offline::sync {

using offline::observability::IntField;
using offline::observability::StringField;
using offline::worker::v1::HttpRequest;
using offline::worker::v1::HttpResponse;
using offline::worker::v1::QueuedAction;

namespace {

constexpr const char* kQueuedMessage = "Action queued for when you are back online.";

} // namespace

Outbox::Outbox(SyncStorePtr store, offline::net::FetcherPtr fetcher, offline::runtime::config::OutboxConfig config)
    : store_(std::move(store)), fetcher_(std::move(fetcher)), config_(std::move(config)) {
}

bool Outbox::Captures(const std::string& method, const offline::util::Url& url) const {
  if (!config_.enabled() || method == "GET") return false;
  for (const auto& prefix : config_.prefixes()) {
    if (offline::util::HasPathPrefix(url.path, prefix)) return true;
  }
  return false;
}

HttpResponse Outbox::Capture(const HttpRequest& request) {
  QueuedAction action;
  action.set_id(offline::util::GenerateUUIDString());
  action.set_method(request.method());
  action.set_url(request.url());
  action.mutable_headers()->CopyFrom(request.headers());
  action.set_body(request.body());
  action.set_created_at_ms(offline::util::NowUnixMillis());

  store_->EnqueueAction(action);
  store_->RegisterTag(config_.tag());

  OFFLINE_LOG_INFO("request queued in outbox",
                   {StringField("action_id", action.id()), StringField("method", action.method()), StringField("url", action.url())});

  offline::worker::v1::QueuedReceipt receipt;
  receipt.set_queued(true);
  receipt.set_message(kQueuedMessage);
  receipt.set_action_id(action.id());

  std::string body;
  const auto  status = google::protobuf::util::MessageToJsonString(receipt, &body);
  if (!status.ok()) {
    throw std::runtime_error("outbox: failed to encode receipt: " + std::string(status.message()));
  }

  HttpResponse response;
  response.set_status(202);
  response.set_status_text("Accepted");
  offline::net::SetHeader(&response, "Content-Type", "application/json");
  response.set_body(body);
  response.set_source(offline::worker::v1::RESPONSE_SOURCE_OUTBOX);
  return response;
}

std::size_t Outbox::Replay() {
  std::lock_guard lock(replay_mutex_);

  for (const auto& action : store_->ListActions()) {
    HttpRequest request;
    request.set_method(action.method());
    request.set_url(action.url());
    request.mutable_headers()->CopyFrom(action.headers());
    request.set_body(action.body());

    try {
      const auto response = fetcher_->Fetch(request);
      if (offline::net::IsOk(response)) {
        store_->RemoveAction(action.id());
        OFFLINE_LOG_INFO("outbox action replayed", {StringField("action_id", action.id())});
      } else {
        OFFLINE_LOG_WARN("outbox action rejected",
                         {StringField("action_id", action.id()), IntField("status", response.status())});
      }
    } catch (const offline::util::NetworkError& e) {
      OFFLINE_LOG_WARN("outbox action still offline", {StringField("action_id", action.id()), StringField("error", e.what())});
    }
  }

  return store_->QueuedActions();
}

std::size_t Outbox::Size() const {
  return store_->QueuedActions();
}

} // namespace offline::sync

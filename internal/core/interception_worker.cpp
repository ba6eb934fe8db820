#include "interception_worker.hpp"

#include <algorithm>
#include <cctype>

#include "internal/cache/request_key.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace offline::core {

using offline::observability::IntField;
using offline::observability::StringField;
using offline::worker::v1::HttpRequest;
using offline::worker::v1::HttpResponse;

namespace {

std::string UpperMethod(std::string method) {
  std::transform(method.begin(), method.end(), method.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return method.empty() ? "GET" : method;
}

} // namespace

InterceptionWorker::InterceptionWorker(Components components, offline::util::Url origin)
    : c_(std::move(components)), origin_(std::move(origin)) {
}

FetchResult InterceptionWorker::Fetch(const HttpRequest& request, const offline::strategy::CancellationToken& cancel) {
  const auto url = offline::util::ResolveUrl(request.url(), origin_);

  HttpRequest normalized = request;
  normalized.set_method(UpperMethod(request.method()));
  normalized.set_url(url.ToString());

  FetchResult result;
  result.policy = c_.classifier->Classify(normalized.method(), url, normalized.mode());

  const bool intercept = c_.lifecycle->HasActive() && c_.clients->IsControlled(normalized.client_id());
  if (!intercept || !result.policy.Intercepted()) {
    result.policy.strategy = offline::worker::v1::STRATEGY_PASSTHROUGH;
    result.response        = Passthrough(normalized, url);
    return result;
  }

  const auto generations = c_.lifecycle->CurrentGenerations();
  const auto key         = offline::cache::RequestKey(normalized.method(), url);

  if (result.policy.strategy == offline::worker::v1::STRATEGY_NETWORK_FIRST) {
    result.response = c_.strategies->NetworkFirst(normalized, key, generations, cancel);
  } else {
    result.response = c_.strategies->CacheFirst(normalized, key, generations, result.policy.route_class, cancel);
  }
  return result;
}

HttpResponse InterceptionWorker::Passthrough(const HttpRequest& request, const offline::util::Url& url) {
  const bool capture = c_.outbox && c_.outbox->Captures(request.method(), url);

  if (capture && !online_) {
    return c_.outbox->Capture(request);
  }

  try {
    return c_.fetcher->Fetch(request);
  } catch (const offline::util::NetworkError& e) {
    if (!capture) throw;
    OFFLINE_LOG_DEBUG("passthrough failed; capturing in outbox", {StringField("url", request.url()), StringField("error", e.what())});
    return c_.outbox->Capture(request);
  }
}

offline::lifecycle::WorkerVersion InterceptionWorker::Install(uint32_t version) {
  return c_.lifecycle->Install(version);
}

offline::control::ControlKind InterceptionWorker::PostMessage(const std::string& data) {
  return c_.control->Handle(data);
}

WorkerStatus InterceptionWorker::Status() const {
  WorkerStatus status;
  status.lifecycle         = c_.lifecycle->Snapshot();
  status.generations       = c_.storage->Keys();
  status.pending_sync_tags = c_.sync->PendingTags();
  status.queued_actions    = c_.outbox ? c_.outbox->Size() : 0;
  status.online            = online_;
  return status;
}

offline::worker::v1::Notification InterceptionWorker::Push(const std::string& data, bool has_data) {
  return c_.notifications->OnPush(data, has_data);
}

offline::push::ClickResult InterceptionWorker::ClickNotification(const std::string& tag, const std::string& action) {
  return c_.notifications->OnClick(tag, action);
}

void InterceptionWorker::CloseNotification(const std::string& tag) {
  if (!c_.notifications->Close(tag)) {
    throw offline::util::NotFound("notification not found: " + tag);
  }
}

std::vector<offline::worker::v1::Notification> InterceptionWorker::ListNotifications() const {
  return c_.notification_center->List();
}

offline::worker::v1::Client InterceptionWorker::RegisterClient(const std::string& url) {
  return c_.clients->Register(url, c_.lifecycle->HasActive());
}

void InterceptionWorker::UnregisterClient(const std::string& id) {
  if (!c_.clients->Unregister(id)) {
    throw offline::util::NotFound("client not found: " + id);
  }
}

std::vector<offline::worker::v1::Client> InterceptionWorker::ListClients() const {
  return c_.clients->List();
}

void InterceptionWorker::RegisterSync(const std::string& tag) {
  c_.sync->Register(tag);
  if (online_) {
    c_.sync_scheduler->Enqueue(tag);
  }
}

void InterceptionWorker::RunSync(const std::string& tag) {
  c_.sync->Run(tag, c_.lifecycle->CurrentGenerations().dynamic_name);
}

std::size_t InterceptionWorker::SetConnectivity(bool online) {
  const bool was_online = online_.exchange(online);
  if (!online || was_online) return 0;

  const auto tags = c_.sync->PendingTags();
  for (const auto& tag : tags) {
    c_.sync_scheduler->Enqueue(tag);
  }
  OFFLINE_LOG_INFO("connectivity restored", {IntField("dispatched_tags", static_cast<int64_t>(tags.size()))});
  return tags.size();
}

} // namespace offline::core

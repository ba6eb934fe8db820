#include "worker_service.hpp"

#include <chrono>
#include <stdexcept>
#include <type_traits>

#include "internal/core/interception_worker.hpp"
#include "internal/lifecycle/lifecycle_state.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace offline::service {

using namespace offline::worker::v1;

namespace {

template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view subject, Fn&& fn) {
  offline::observability::SpanScope span(route);
  if (!subject.empty()) {
    span.SetAttribute("worker.subject", subject);
  }

  const auto started_at = std::chrono::steady_clock::now();
  const auto elapsed_ms = [&] {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      offline::observability::Metrics::Instance().RecordRequest(route, true);
      offline::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
      return;
    } else {
      auto result = fn();
      offline::observability::Metrics::Instance().RecordRequest(route, true);
      offline::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    OFFLINE_LOG_ERROR("RPC failed", {offline::observability::StringField("route", route), offline::observability::StringField("error", ex.what()),
                                     offline::observability::StringField("subject", subject)});
    offline::observability::Metrics::Instance().RecordRequest(route, false);
    offline::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
    throw;
  }
}

void FillVersion(const std::optional<offline::lifecycle::WorkerVersion>& version, LifecycleState* state, std::string* static_name,
                 std::string* dynamic_name) {
  if (!version) return;
  *state = offline::lifecycle::ToProto(version->state);
  if (static_name) *static_name = version->static_generation;
  if (dynamic_name) *dynamic_name = version->dynamic_generation;
}

} // namespace

WorkerService::WorkerService(std::shared_ptr<offline::core::InterceptionWorker> worker) : worker_(std::move(worker)) {
}

FetchResponse WorkerService::Fetch(const FetchRequest& req, std::function<bool()> cancelled) {
  return ObserveRpc("WorkerService.Fetch", req.request().url(), [&] {
    if (req.request().url().empty()) {
      throw offline::util::InvalidArgument("fetch: request url is required");
    }

    auto result = worker_->Fetch(req.request(), offline::strategy::CancellationToken(std::move(cancelled)));

    FetchResponse resp;
    *resp.mutable_response() = std::move(result.response);
    resp.set_route_class(result.policy.route_class);
    resp.set_strategy(result.policy.strategy);
    return resp;
  });
}

void WorkerService::PostMessage(const PostMessageRequest& req) {
  ObserveRpc("WorkerService.PostMessage", "", [&] { worker_->PostMessage(req.data()); });
}

InstallResponse WorkerService::Install(const InstallRequest& req) {
  return ObserveRpc("WorkerService.Install", std::to_string(req.version()), [&] {
    const auto version = worker_->Install(req.version());

    InstallResponse resp;
    resp.set_state(offline::lifecycle::ToProto(version.state));
    resp.set_static_generation(version.static_generation);
    resp.set_dynamic_generation(version.dynamic_generation);
    return resp;
  });
}

GetStatusResponse WorkerService::GetStatus(const GetStatusRequest&) {
  return ObserveRpc("WorkerService.GetStatus", "", [&] {
    const auto status = worker_->Status();

    GetStatusResponse resp;
    LifecycleState    state = LIFECYCLE_STATE_UNSPECIFIED;
    // the active version wins; otherwise report the latest install attempt
    FillVersion(status.lifecycle.latest, &state, nullptr, nullptr);
    FillVersion(status.lifecycle.active, &state, resp.mutable_static_generation(), resp.mutable_dynamic_generation());
    resp.set_state(state);

    LifecycleState waiting = LIFECYCLE_STATE_UNSPECIFIED;
    FillVersion(status.lifecycle.waiting, &waiting, nullptr, nullptr);
    resp.set_waiting_state(waiting);

    for (const auto& name : status.generations) resp.add_generations(name);
    for (const auto& tag : status.pending_sync_tags) resp.add_pending_sync_tags(tag);
    resp.set_queued_actions(status.queued_actions);
    resp.set_online(status.online);
    return resp;
  });
}

PushResponse WorkerService::Push(const PushRequest& req) {
  return ObserveRpc("WorkerService.Push", "", [&] {
    PushResponse resp;
    *resp.mutable_notification() = worker_->Push(req.data(), req.has_data());
    return resp;
  });
}

ClickNotificationResponse WorkerService::ClickNotification(const ClickNotificationRequest& req) {
  return ObserveRpc("WorkerService.ClickNotification", req.tag(), [&] {
    const auto result = worker_->ClickNotification(req.tag(), req.action());

    ClickNotificationResponse resp;
    resp.set_outcome(result.outcome);
    resp.set_client_id(result.client_id);
    resp.set_url(result.url);
    return resp;
  });
}

void WorkerService::CloseNotification(const CloseNotificationRequest& req) {
  ObserveRpc("WorkerService.CloseNotification", req.tag(), [&] { worker_->CloseNotification(req.tag()); });
}

ListNotificationsResponse WorkerService::ListNotifications(const ListNotificationsRequest&) {
  return ObserveRpc("WorkerService.ListNotifications", "", [&] {
    ListNotificationsResponse resp;
    for (const auto& notification : worker_->ListNotifications()) {
      *resp.add_notifications() = notification;
    }
    return resp;
  });
}

RegisterClientResponse WorkerService::RegisterClient(const RegisterClientRequest& req) {
  return ObserveRpc("WorkerService.RegisterClient", req.url(), [&] {
    RegisterClientResponse resp;
    *resp.mutable_client() = worker_->RegisterClient(req.url());
    return resp;
  });
}

void WorkerService::UnregisterClient(const UnregisterClientRequest& req) {
  ObserveRpc("WorkerService.UnregisterClient", req.id(), [&] { worker_->UnregisterClient(req.id()); });
}

ListClientsResponse WorkerService::ListClients(const ListClientsRequest&) {
  return ObserveRpc("WorkerService.ListClients", "", [&] {
    ListClientsResponse resp;
    for (const auto& client : worker_->ListClients()) {
      *resp.add_clients() = client;
    }
    return resp;
  });
}

void WorkerService::RegisterSync(const RegisterSyncRequest& req) {
  ObserveRpc("WorkerService.RegisterSync", req.tag(), [&] { worker_->RegisterSync(req.tag()); });
}

SyncResponse WorkerService::Sync(const SyncRequest& req) {
  return ObserveRpc("WorkerService.Sync", req.tag(), [&] {
    worker_->RunSync(req.tag());

    SyncResponse resp;
    resp.set_ok(true);
    return resp;
  });
}

SetConnectivityResponse WorkerService::SetConnectivity(const SetConnectivityRequest& req) {
  return ObserveRpc("WorkerService.SetConnectivity", req.online() ? "online" : "offline", [&] {
    SetConnectivityResponse resp;
    resp.set_dispatched_tags(static_cast<uint32_t>(worker_->SetConnectivity(req.online())));
    return resp;
  });
}

} // namespace offline::service

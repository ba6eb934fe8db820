#pragma once

#include <functional>
#include <memory>

#include "offline/worker/v1.hpp"

namespace offline::core {
class InterceptionWorker;
}

namespace offline::service {

/*
  Protocol-facing facade over the InterceptionWorker.

  Translates between wire messages and worker calls and wraps every call
  in a span plus request metrics. Errors propagate as exceptions; the gRPC
  adapter maps them to status codes.
*/
class WorkerService {
 public:
  explicit WorkerService(std::shared_ptr<offline::core::InterceptionWorker> worker);

  offline::worker::v1::FetchResponse Fetch(const offline::worker::v1::FetchRequest& req, std::function<bool()> cancelled = {});
  void                               PostMessage(const offline::worker::v1::PostMessageRequest& req);

  offline::worker::v1::InstallResponse   Install(const offline::worker::v1::InstallRequest& req);
  offline::worker::v1::GetStatusResponse GetStatus(const offline::worker::v1::GetStatusRequest& req);

  offline::worker::v1::PushResponse              Push(const offline::worker::v1::PushRequest& req);
  offline::worker::v1::ClickNotificationResponse ClickNotification(const offline::worker::v1::ClickNotificationRequest& req);
  void                                           CloseNotification(const offline::worker::v1::CloseNotificationRequest& req);
  offline::worker::v1::ListNotificationsResponse ListNotifications(const offline::worker::v1::ListNotificationsRequest& req);

  offline::worker::v1::RegisterClientResponse RegisterClient(const offline::worker::v1::RegisterClientRequest& req);
  void                                        UnregisterClient(const offline::worker::v1::UnregisterClientRequest& req);
  offline::worker::v1::ListClientsResponse    ListClients(const offline::worker::v1::ListClientsRequest& req);

  void                                         RegisterSync(const offline::worker::v1::RegisterSyncRequest& req);
  offline::worker::v1::SyncResponse            Sync(const offline::worker::v1::SyncRequest& req);
  offline::worker::v1::SetConnectivityResponse SetConnectivity(const offline::worker::v1::SetConnectivityRequest& req);

 private:
  std::shared_ptr<offline::core::InterceptionWorker> worker_;
};

} // namespace offline::service

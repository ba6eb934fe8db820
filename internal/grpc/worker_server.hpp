#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/worker_service.hpp"
#include "offline/worker/v1.hpp"

namespace offline::grpc {

class WorkerServer final : public offline::worker::v1::WorkerService::Service {
public:
  explicit WorkerServer(std::shared_ptr<offline::service::WorkerService> svc);

  ::grpc::Status Fetch(::grpc::ServerContext* ctx,
                       const offline::worker::v1::FetchRequest* req,
                       offline::worker::v1::FetchResponse* resp) override;

  ::grpc::Status PostMessage(::grpc::ServerContext* ctx,
                             const offline::worker::v1::PostMessageRequest* req,
                             offline::worker::v1::PostMessageResponse* resp) override;

  ::grpc::Status Install(::grpc::ServerContext* ctx,
                         const offline::worker::v1::InstallRequest* req,
                         offline::worker::v1::InstallResponse* resp) override;

  ::grpc::Status GetStatus(::grpc::ServerContext* ctx,
                           const offline::worker::v1::GetStatusRequest* req,
                           offline::worker::v1::GetStatusResponse* resp) override;

  ::grpc::Status Push(::grpc::ServerContext* ctx,
                      const offline::worker::v1::PushRequest* req,
                      offline::worker::v1::PushResponse* resp) override;

  ::grpc::Status ClickNotification(::grpc::ServerContext* ctx,
                                   const offline::worker::v1::ClickNotificationRequest* req,
                                   offline::worker::v1::ClickNotificationResponse* resp) override;

  ::grpc::Status CloseNotification(::grpc::ServerContext* ctx,
                                   const offline::worker::v1::CloseNotificationRequest* req,
                                   offline::worker::v1::CloseNotificationResponse* resp) override;

  ::grpc::Status ListNotifications(::grpc::ServerContext* ctx,
                                   const offline::worker::v1::ListNotificationsRequest* req,
                                   offline::worker::v1::ListNotificationsResponse* resp) override;

  ::grpc::Status RegisterClient(::grpc::ServerContext* ctx,
                                const offline::worker::v1::RegisterClientRequest* req,
                                offline::worker::v1::RegisterClientResponse* resp) override;

  ::grpc::Status UnregisterClient(::grpc::ServerContext* ctx,
                                  const offline::worker::v1::UnregisterClientRequest* req,
                                  offline::worker::v1::UnregisterClientResponse* resp) override;

  ::grpc::Status ListClients(::grpc::ServerContext* ctx,
                             const offline::worker::v1::ListClientsRequest* req,
                             offline::worker::v1::ListClientsResponse* resp) override;

  ::grpc::Status RegisterSync(::grpc::ServerContext* ctx,
                              const offline::worker::v1::RegisterSyncRequest* req,
                              offline::worker::v1::RegisterSyncResponse* resp) override;

  ::grpc::Status Sync(::grpc::ServerContext* ctx,
                      const offline::worker::v1::SyncRequest* req,
                      offline::worker::v1::SyncResponse* resp) override;

  ::grpc::Status SetConnectivity(::grpc::ServerContext* ctx,
                                 const offline::worker::v1::SetConnectivityRequest* req,
                                 offline::worker::v1::SetConnectivityResponse* resp) override;

private:
  std::shared_ptr<offline::service::WorkerService> service_;
};

} // namespace offline::grpc

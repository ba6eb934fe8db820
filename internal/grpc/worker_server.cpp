#include "worker_server.hpp"
#include "grpc_error.hpp"

namespace offline::grpc {

WorkerServer::WorkerServer(std::shared_ptr<offline::service::WorkerService> svc)
    : service_(std::move(svc)) {}

::grpc::Status WorkerServer::Fetch(::grpc::ServerContext* ctx,
                                   const offline::worker::v1::FetchRequest* req,
                                   offline::worker::v1::FetchResponse* resp) {
  try {
    *resp = service_->Fetch(*req, [ctx] { return ctx->IsCancelled(); });
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status WorkerServer::PostMessage(::grpc::ServerContext*,
                                         const offline::worker::v1::PostMessageRequest* req,
                                         offline::worker::v1::PostMessageResponse*) {
  try {
    service_->PostMessage(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status WorkerServer::Install(::grpc::ServerContext*,
                                     const offline::worker::v1::InstallRequest* req,
                                     offline::worker::v1::InstallResponse* resp) {
  try {
    *resp = service_->Install(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status WorkerServer::GetStatus(::grpc::ServerContext*,
                                       const offline::worker::v1::GetStatusRequest* req,
                                       offline::worker::v1::GetStatusResponse* resp) {
  try {
    *resp = service_->GetStatus(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status WorkerServer::Push(::grpc::ServerContext*,
                                  const offline::worker::v1::PushRequest* req,
                                  offline::worker::v1::PushResponse* resp) {
  try {
    *resp = service_->Push(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status WorkerServer::ClickNotification(::grpc::ServerContext*,
                                               const offline::worker::v1::ClickNotificationRequest* req,
                                               offline::worker::v1::ClickNotificationResponse* resp) {
  try {
    *resp = service_->ClickNotification(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status WorkerServer::CloseNotification(::grpc::ServerContext*,
                                               const offline::worker::v1::CloseNotificationRequest* req,
                                               offline::worker::v1::CloseNotificationResponse*) {
  try {
    service_->CloseNotification(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status WorkerServer::ListNotifications(::grpc::ServerContext*,
                                               const offline::worker::v1::ListNotificationsRequest* req,
                                               offline::worker::v1::ListNotificationsResponse* resp) {
  try {
    *resp = service_->ListNotifications(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status WorkerServer::RegisterClient(::grpc::ServerContext*,
                                            const offline::worker::v1::RegisterClientRequest* req,
                                            offline::worker::v1::RegisterClientResponse* resp) {
  try {
    *resp = service_->RegisterClient(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status WorkerServer::UnregisterClient(::grpc::ServerContext*,
                                              const offline::worker::v1::UnregisterClientRequest* req,
                                              offline::worker::v1::UnregisterClientResponse*) {
  try {
    service_->UnregisterClient(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status WorkerServer::ListClients(::grpc::ServerContext*,
                                         const offline::worker::v1::ListClientsRequest* req,
                                         offline::worker::v1::ListClientsResponse* resp) {
  try {
    *resp = service_->ListClients(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status WorkerServer::RegisterSync(::grpc::ServerContext*,
                                          const offline::worker::v1::RegisterSyncRequest* req,
                                          offline::worker::v1::RegisterSyncResponse*) {
  try {
    service_->RegisterSync(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status WorkerServer::Sync(::grpc::ServerContext*,
                                  const offline::worker::v1::SyncRequest* req,
                                  offline::worker::v1::SyncResponse* resp) {
  try {
    *resp = service_->Sync(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status WorkerServer::SetConnectivity(::grpc::ServerContext*,
                                             const offline::worker::v1::SetConnectivityRequest* req,
                                             offline::worker::v1::SetConnectivityResponse* resp) {
  try {
    *resp = service_->SetConnectivity(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace offline::grpc

#include <grpcpp/grpcpp.h>

#include <cstdlib>
#include <iostream>
#include <string>

#include "offline/worker/v1.hpp"

using namespace offline::worker::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  workerctl <addr> fetch <url> [method=GET] [mode=navigate|cors|same-origin|no-cors]\n"
            << "  workerctl <addr> install <version>\n"
            << "  workerctl <addr> status\n"
            << "  workerctl <addr> message <json>\n"
            << "  workerctl <addr> push [payload]\n"
            << "  workerctl <addr> click <tag> [action]\n"
            << "  workerctl <addr> close <tag>\n"
            << "  workerctl <addr> notifications\n"
            << "  workerctl <addr> client-add <url>\n"
            << "  workerctl <addr> client-remove <id>\n"
            << "  workerctl <addr> clients\n"
            << "  workerctl <addr> sync-register <tag>\n"
            << "  workerctl <addr> sync <tag>\n"
            << "  workerctl <addr> online|offline\n";
}

static RequestMode ParseMode(const std::string& value) {
  if (value == "navigate") return REQUEST_MODE_NAVIGATE;
  if (value == "cors") return REQUEST_MODE_CORS;
  if (value == "same-origin") return REQUEST_MODE_SAME_ORIGIN;
  if (value == "no-cors") return REQUEST_MODE_NO_CORS;
  std::cerr << "unsupported mode: " << value << "\n";
  std::exit(1);
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_message() << "\n";
  return 2;
}

static void PrintNotification(const Notification& n) {
  std::cout << "tag=" << n.tag() << " title=" << n.title() << " body=" << n.body() << " url=" << n.url() << "\n";
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = WorkerService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "fetch") {
    if (argc < 4) return 1;

    FetchRequest req;
    req.mutable_request()->set_url(argv[3]);
    req.mutable_request()->set_method(argc >= 5 ? argv[4] : "GET");
    if (argc >= 6) req.mutable_request()->set_mode(ParseMode(argv[5]));

    FetchResponse resp;
    auto          status = stub->Fetch(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "status=" << resp.response().status() << "\n";
    std::cout << "source=" << ResponseSource_Name(resp.response().source()) << "\n";
    std::cout << "strategy=" << Strategy_Name(resp.strategy()) << "\n";
    std::cout << resp.response().body() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "install") {
    if (argc < 4) return 1;

    InstallRequest req;
    req.set_version(static_cast<uint32_t>(std::stoul(argv[3])));

    InstallResponse resp;
    auto            status = stub->Install(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "state=" << LifecycleState_Name(resp.state()) << "\n";
    std::cout << "static=" << resp.static_generation() << "\n";
    std::cout << "dynamic=" << resp.dynamic_generation() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "status") {
    GetStatusRequest  req;
    GetStatusResponse resp;
    auto              status = stub->GetStatus(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "state=" << LifecycleState_Name(resp.state()) << "\n";
    std::cout << "waiting=" << LifecycleState_Name(resp.waiting_state()) << "\n";
    std::cout << "static=" << resp.static_generation() << "\n";
    std::cout << "dynamic=" << resp.dynamic_generation() << "\n";
    for (const auto& name : resp.generations()) std::cout << "generation=" << name << "\n";
    for (const auto& tag : resp.pending_sync_tags()) std::cout << "pending_sync=" << tag << "\n";
    std::cout << "queued_actions=" << resp.queued_actions() << "\n";
    std::cout << "online=" << (resp.online() ? "true" : "false") << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "message") {
    if (argc < 4) return 1;

    PostMessageRequest req;
    req.set_data(argv[3]);

    PostMessageResponse resp;
    auto                status = stub->PostMessage(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "delivered\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "push") {
    PushRequest req;
    if (argc >= 4) {
      req.set_data(argv[3]);
      req.set_has_data(true);
    }

    PushResponse resp;
    auto         status = stub->Push(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintNotification(resp.notification());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "click") {
    if (argc < 4) return 1;

    ClickNotificationRequest req;
    req.set_tag(argv[3]);
    if (argc >= 5) req.set_action(argv[4]);

    ClickNotificationResponse resp;
    auto                      status = stub->ClickNotification(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "outcome=" << ClickOutcome_Name(resp.outcome()) << "\n";
    if (!resp.client_id().empty()) std::cout << "client=" << resp.client_id() << " url=" << resp.url() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "close") {
    if (argc < 4) return 1;

    CloseNotificationRequest req;
    req.set_tag(argv[3]);

    CloseNotificationResponse resp;
    auto                      status = stub->CloseNotification(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "closed\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "notifications") {
    ListNotificationsRequest  req;
    ListNotificationsResponse resp;
    auto                      status = stub->ListNotifications(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& n : resp.notifications()) PrintNotification(n);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "client-add") {
    if (argc < 4) return 1;

    RegisterClientRequest req;
    req.set_url(argv[3]);

    RegisterClientResponse resp;
    auto                   status = stub->RegisterClient(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "client=" << resp.client().id() << " controlled=" << (resp.client().controlled() ? "true" : "false") << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "client-remove") {
    if (argc < 4) return 1;

    UnregisterClientRequest req;
    req.set_id(argv[3]);

    UnregisterClientResponse resp;
    auto                     status = stub->UnregisterClient(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "removed\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "clients") {
    ListClientsRequest  req;
    ListClientsResponse resp;
    auto                status = stub->ListClients(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& c : resp.clients()) {
      std::cout << "client=" << c.id() << " url=" << c.url() << " focused=" << (c.focused() ? "true" : "false")
                << " controlled=" << (c.controlled() ? "true" : "false") << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "sync-register") {
    if (argc < 4) return 1;

    RegisterSyncRequest req;
    req.set_tag(argv[3]);

    RegisterSyncResponse resp;
    auto                 status = stub->RegisterSync(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "registered\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "sync") {
    if (argc < 4) return 1;

    SyncRequest req;
    req.set_tag(argv[3]);

    SyncResponse resp;
    auto         status = stub->Sync(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "ok\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "online" || cmd == "offline") {
    SetConnectivityRequest req;
    req.set_online(cmd == "online");

    SetConnectivityResponse resp;
    auto                    status = stub->SetConnectivity(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "dispatched=" << resp.dispatched_tags() << "\n";
    return 0;
  }

  Usage();
  return 1;
}

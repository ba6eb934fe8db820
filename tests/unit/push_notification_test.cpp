#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/clients/client_registry.hpp"
#include "internal/config/defaults.hpp"
#include "internal/push/notification_center.hpp"
#include "internal/push/notification_handler.hpp"
#include "internal/push/push_decoder.hpp"
#include "internal/util/errors.hpp"

namespace {

using offline::push::NotificationHandler;
using namespace offline::worker::v1;

struct Harness {
  std::shared_ptr<offline::push::NotificationCenter>  center = std::make_shared<offline::push::NotificationCenter>();
  std::shared_ptr<offline::clients::ClientRegistry>   clients;
  std::unique_ptr<NotificationHandler>                handler;

  Harness() {
    clients = std::make_shared<offline::clients::ClientRegistry>(offline::util::ParseAbsoluteUrl("http://app.local"));
    handler = std::make_unique<NotificationHandler>(center, clients, offline::config::DefaultConfig().notifications());
  }
};

void TestStructuredPushUsesPayloadFields() {
  Harness h;
  const auto shown = h.handler->OnPush(R"({"title":"New mail","body":"From Ana","tag":"mail-1","url":"/mail/1"})", true);

  assert(shown.title() == "New mail");
  assert(shown.body() == "From Ana");
  assert(shown.tag() == "mail-1");
  assert(shown.url() == "/mail/1");
  assert(shown.icon() == "/icons/icon-192.png");
  assert(shown.vibrate_size() == 3);
  assert(shown.actions_size() == 2);
  assert(shown.actions(0).action() == "open");
  assert(shown.timestamp_ms() > 0);

  assert(h.center->Get("mail-1").has_value());
}

void TestMissingPayloadUsesDefaults() {
  Harness h;
  const auto shown = h.handler->OnPush("", false);
  assert(shown.title() == "Workspace");
  assert(shown.body() == "You have a new notification");
  assert(shown.tag() == "workspace-notification");
  assert(shown.url() == "/dashboard");
}

void TestRawTextBecomesBody() {
  Harness h;
  const auto shown = h.handler->OnPush("Meeting starts in 5 minutes", true);
  assert(shown.title() == "Workspace");
  assert(shown.body() == "Meeting starts in 5 minutes");
  assert(shown.tag() == "workspace-notification");
}

void TestUnknownJsonFieldsAreIgnored() {
  const auto decoded = offline::push::DecodePush(R"({"title":"Hi","priority":"high"})", true);
  assert(std::holds_alternative<offline::push::ParsedPush>(decoded));
  assert(std::get<offline::push::ParsedPush>(decoded).message.title() == "Hi");
}

void TestPayloadActionsReplaceDefaults() {
  Harness h;
  const auto shown = h.handler->OnPush(R"({"tag":"meet","actions":[{"action":"join","title":"Join"}]})", true);
  assert(shown.actions_size() == 1);
  assert(shown.actions(0).action() == "join");
}

void TestSameTagReplaces() {
  Harness h;
  h.handler->OnPush(R"({"title":"first","tag":"chat"})", true);
  h.handler->OnPush(R"({"title":"second","tag":"chat"})", true);

  const auto live = h.center->List();
  assert(live.size() == 1);
  assert(live[0].title() == "second");
}

void TestDismissOnlyCloses() {
  Harness h;
  h.clients->Register("/mail", true);
  h.handler->OnPush(R"({"tag":"mail-1"})", true);

  const auto result = h.handler->OnClick("mail-1", "dismiss");
  assert(result.outcome == CLICK_OUTCOME_DISMISSED);
  assert(!h.center->Get("mail-1").has_value());
  assert(!h.clients->List()[0].focused());
}

void TestClickFocusesSameOriginWindow() {
  Harness h;
  h.clients->Register("http://other.local/page", true);
  const auto window = h.clients->Register("/dashboard", true);
  h.handler->OnPush(R"({"tag":"mail-1","url":"/mail/1"})", true);

  const auto result = h.handler->OnClick("mail-1", "open");
  assert(result.outcome == CLICK_OUTCOME_FOCUSED);
  assert(result.client_id == window.id());
  assert(result.url == "http://app.local/mail/1");

  const auto updated = h.clients->Get(window.id());
  assert(updated->focused());
  assert(updated->url() == "http://app.local/mail/1");
  assert(h.clients->List().size() == 2);
}

void TestClickOpensWindowWhenNoneExists() {
  Harness h;
  h.handler->OnPush(R"({"tag":"cal"})", true);

  const auto result = h.handler->OnClick("cal", "");
  assert(result.outcome == CLICK_OUTCOME_OPENED);
  assert(result.url == "http://app.local/dashboard");

  const auto windows = h.clients->List();
  assert(windows.size() == 1);
  assert(windows[0].focused());
  assert(windows[0].controlled());
}

void TestClickOnUnknownTagThrows() {
  Harness h;
  bool threw = false;
  try {
    h.handler->OnClick("missing", "open");
  } catch (const offline::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestStructuredPushUsesPayloadFields();
  TestMissingPayloadUsesDefaults();
  TestRawTextBecomesBody();
  TestUnknownJsonFieldsAreIgnored();
  TestPayloadActionsReplaceDefaults();
  TestSameTagReplaces();
  TestDismissOnlyCloses();
  TestClickFocusesSameOriginWindow();
  TestClickOpensWindowWhenNoneExists();
  TestClickOnUnknownTagThrows();

  std::cout << "offline_worker_unit_push_notification: pass\n";
  return 0;
}

#include "notification_handler.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "push_decoder.hpp"

namespace offline::push {

using offline::observability::StringField;

namespace {

constexpr const char* kDismissAction = "dismiss";

} // namespace

NotificationHandler::NotificationHandler(std::shared_ptr<NotificationCenter>               center,
                                         std::shared_ptr<offline::clients::ClientRegistry> clients,
                                         offline::runtime::config::NotificationDefaults    defaults)
    : center_(std::move(center)), clients_(std::move(clients)), defaults_(std::move(defaults)) {
}

offline::worker::v1::Notification NotificationHandler::OnPush(const std::string& data, bool has_data) {
  const auto decoded = DecodePush(data, has_data);
  if (std::holds_alternative<RawPush>(decoded)) {
    OFFLINE_LOG_DEBUG("push payload is not structured; using raw text body");
  }

  auto notification = Normalize(decoded, defaults_, offline::util::NowUnixMillis());
  center_->Show(notification);

  OFFLINE_LOG_INFO("notification shown", {StringField("tag", notification.tag()), StringField("title", notification.title())});
  return notification;
}

ClickResult NotificationHandler::OnClick(const std::string& tag, const std::string& action) {
  const auto notification = center_->Get(tag);
  if (!notification) {
    throw offline::util::NotFound("notification not found: " + tag);
  }
  center_->Close(tag);

  ClickResult result;
  if (action == kDismissAction) {
    result.outcome = offline::worker::v1::CLICK_OUTCOME_DISMISSED;
    return result;
  }

  const std::string& url = notification->url().empty() ? defaults_.url() : notification->url();

  if (const auto existing = clients_->FindSameOrigin()) {
    const auto client = clients_->FocusAndNavigate(existing->id(), url);
    result.outcome    = offline::worker::v1::CLICK_OUTCOME_FOCUSED;
    result.client_id  = client.id();
    result.url        = client.url();
  } else {
    const auto client = clients_->OpenWindow(url, /*controlled=*/true);
    result.outcome    = offline::worker::v1::CLICK_OUTCOME_OPENED;
    result.client_id  = client.id();
    result.url        = client.url();
  }

  OFFLINE_LOG_INFO("notification clicked", {StringField("tag", tag), StringField("action", action), StringField("client", result.client_id)});
  return result;
}

bool NotificationHandler::Close(const std::string& tag) {
  return center_->Close(tag);
}

} // namespace offline::push

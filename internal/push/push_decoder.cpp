#include "push_decoder.hpp"

#include <google/protobuf/util/json_util.h>

namespace offline::push {

using offline::worker::v1::Notification;
using offline::worker::v1::PushMessage;

namespace {

const std::string& Or(const std::string& value, const std::string& fallback) {
  return value.empty() ? fallback : value;
}

void ApplyDefaultActions(Notification* notification, const offline::runtime::config::NotificationDefaults& defaults) {
  for (const auto& configured : defaults.actions()) {
    auto* action = notification->add_actions();
    action->set_action(configured.action());
    action->set_title(configured.title());
  }
}

} // namespace

DecodedPush DecodePush(const std::string& data, bool has_data) {
  if (!has_data) return ParsedPush{};

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  PushMessage message;
  const auto  status = google::protobuf::util::JsonStringToMessage(data, &message, options);
  if (!status.ok()) {
    return RawPush{data};
  }
  return ParsedPush{std::move(message)};
}

Notification Normalize(const DecodedPush&                                    decoded,
                       const offline::runtime::config::NotificationDefaults& defaults,
                       uint64_t                                              timestamp_ms) {
  Notification notification;
  notification.set_timestamp_ms(timestamp_ms);
  notification.mutable_vibrate()->CopyFrom(defaults.vibrate());

  if (const auto* raw = std::get_if<RawPush>(&decoded)) {
    notification.set_title(defaults.title());
    notification.set_body(Or(raw->text, defaults.body()));
    notification.set_icon(defaults.icon());
    notification.set_badge(defaults.badge());
    notification.set_tag(defaults.tag());
    notification.set_url(defaults.url());
    ApplyDefaultActions(&notification, defaults);
    return notification;
  }

  const auto& message = std::get<ParsedPush>(decoded).message;
  notification.set_title(Or(message.title(), defaults.title()));
  notification.set_body(Or(message.body(), defaults.body()));
  notification.set_icon(Or(message.icon(), defaults.icon()));
  notification.set_badge(Or(message.badge(), defaults.badge()));
  notification.set_tag(Or(message.tag(), defaults.tag()));
  notification.set_url(Or(message.url(), defaults.url()));
  if (message.actions_size() > 0) {
    notification.mutable_actions()->CopyFrom(message.actions());
  } else {
    ApplyDefaultActions(&notification, defaults);
  }
  return notification;
}

} // namespace offline::push

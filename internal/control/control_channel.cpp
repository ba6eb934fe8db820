#include "control_channel.hpp"

#include <google/protobuf/util/json_util.h>

#include "internal/lifecycle/lifecycle_manager.hpp"
#include "internal/observability/logging.hpp"
#include "offline/worker/v1/notification.pb.h"

namespace offline::control {

using offline::observability::StringField;

ControlKind ParseControlMessage(const std::string& data) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  offline::worker::v1::ControlMessage message;
  if (!google::protobuf::util::JsonStringToMessage(data, &message, options).ok()) {
    return ControlKind::kUnknown;
  }

  const auto& type = message.type();
  if (type == "ACTIVATE_NOW" || type == "SKIP_WAITING") return ControlKind::kActivateNow;
  if (type == "PURGE_ALL" || type == "CLEAR_CACHE") return ControlKind::kPurgeAll;
  return ControlKind::kUnknown;
}

ControlChannel::ControlChannel(std::shared_ptr<offline::lifecycle::LifecycleManager> lifecycle) : lifecycle_(std::move(lifecycle)) {
}

ControlKind ControlChannel::Handle(const std::string& data) {
  const auto kind = ParseControlMessage(data);
  switch (kind) {
    case ControlKind::kActivateNow:
      lifecycle_->ActivateWaiting();
      break;
    case ControlKind::kPurgeAll:
      lifecycle_->PurgeAll();
      break;
    case ControlKind::kUnknown:
      OFFLINE_LOG_DEBUG("control message ignored", {StringField("data", data)});
      break;
  }
  return kind;
}

} // namespace offline::control

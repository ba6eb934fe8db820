#pragma once

#include <memory>
#include <string>

#include "config/config.pb.h"
#include "internal/clients/client_registry.hpp"
#include "notification_center.hpp"
#include "offline/worker/v1/worker_service.pb.h"

namespace offline::push {

struct ClickResult {
  offline::worker::v1::ClickOutcome outcome = offline::worker::v1::CLICK_OUTCOME_DISMISSED;
  std::string                       client_id;
  std::string                       url;
};

/*
  Push delivery and notification interaction.

  Click routing:
    "dismiss"   → close only
    otherwise   → close, then focus + navigate the first same-origin
                  window, or open a new window when none exists
*/
class NotificationHandler {
 public:
  NotificationHandler(std::shared_ptr<NotificationCenter>               center,
                      std::shared_ptr<offline::clients::ClientRegistry> clients,
                      offline::runtime::config::NotificationDefaults    defaults);

  offline::worker::v1::Notification OnPush(const std::string& data, bool has_data);

  // throws util::NotFound for an unknown tag
  ClickResult OnClick(const std::string& tag, const std::string& action);

  bool Close(const std::string& tag);

 private:
  std::shared_ptr<NotificationCenter>               center_;
  std::shared_ptr<offline::clients::ClientRegistry> clients_;
  offline::runtime::config::NotificationDefaults    defaults_;
};

} // namespace offline::push

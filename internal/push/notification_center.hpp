#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "offline/worker/v1/notification.pb.h"

namespace offline::push {

/*
  Live notifications keyed by tag. Showing a notification whose tag is
  already live replaces it.
*/
class NotificationCenter {
 public:
  void Show(const offline::worker::v1::Notification& notification);

  bool Close(const std::string& tag);

  std::optional<offline::worker::v1::Notification> Get(const std::string& tag) const;

  std::vector<offline::worker::v1::Notification> List() const;

 private:
  mutable std::mutex                                       mutex_;
  std::map<std::string, offline::worker::v1::Notification> live_;
};

} // namespace offline::push

#include "notification_center.hpp"

namespace offline::push {

void NotificationCenter::Show(const offline::worker::v1::Notification& notification) {
  std::lock_guard lock(mutex_);
  live_[notification.tag()] = notification;
}

bool NotificationCenter::Close(const std::string& tag) {
  std::lock_guard lock(mutex_);
  return live_.erase(tag) > 0;
}

std::optional<offline::worker::v1::Notification> NotificationCenter::Get(const std::string& tag) const {
  std::lock_guard lock(mutex_);
  const auto      it = live_.find(tag);
  if (it == live_.end()) return std::nullopt;
  return it->second;
}

std::vector<offline::worker::v1::Notification> NotificationCenter::List() const {
  std::lock_guard lock(mutex_);
  std::vector<offline::worker::v1::Notification> out;
  out.reserve(live_.size());
  for (const auto& [tag, notification] : live_) {
    out.push_back(notification);
  }
  return out;
}

} // namespace offline::push

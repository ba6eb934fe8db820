#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/util/url.hpp"
#include "offline/worker/v1/notification.pb.h"

namespace offline::clients {

/*
  Window clients known to the worker.

  Focus, navigation and window opening are recorded here as state changes;
  the host applies them to real windows after reading ListClients.
  At most one client is focused at a time.
*/
class ClientRegistry {
 public:
  explicit ClientRegistry(offline::util::Url origin);

  offline::worker::v1::Client Register(const std::string& url, bool controlled);

  bool Unregister(const std::string& id);

  std::optional<offline::worker::v1::Client> Get(const std::string& id) const;

  // registration order
  std::vector<offline::worker::v1::Client> List() const;

  /*
    Take control of every uncontrolled client. Returns how many changed.
  */
  std::size_t Claim();

  /*
    First registered window whose URL shares the worker's origin.
  */
  std::optional<offline::worker::v1::Client> FindSameOrigin() const;

  offline::worker::v1::Client FocusAndNavigate(const std::string& id, const std::string& url);

  offline::worker::v1::Client OpenWindow(const std::string& url, bool controlled);

  /*
    Unknown or empty ids count as controlled: requests without a
    registered window (new navigations) are still intercepted.
  */
  bool IsControlled(const std::string& id) const;

 private:
  std::string Resolve(const std::string& url) const;
  void FocusUnlocked(offline::worker::v1::Client* client);

  offline::util::Url origin_;

  mutable std::mutex                       mutex_;
  std::vector<offline::worker::v1::Client> clients_;
};

} // namespace offline::clients

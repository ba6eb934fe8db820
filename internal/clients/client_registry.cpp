#include "client_registry.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace offline::clients {

using offline::worker::v1::Client;

ClientRegistry::ClientRegistry(offline::util::Url origin) : origin_(std::move(origin)) {
}

Client ClientRegistry::Register(const std::string& url, bool controlled) {
  Client client;
  client.set_id(offline::util::GenerateUUIDString());
  client.set_url(Resolve(url));
  client.set_controlled(controlled);

  std::lock_guard lock(mutex_);
  clients_.push_back(client);
  return client;
}

bool ClientRegistry::Unregister(const std::string& id) {
  std::lock_guard lock(mutex_);
  const auto      it = std::find_if(clients_.begin(), clients_.end(), [&](const Client& c) { return c.id() == id; });
  if (it == clients_.end()) return false;
  clients_.erase(it);
  return true;
}

std::optional<Client> ClientRegistry::Get(const std::string& id) const {
  std::lock_guard lock(mutex_);
  for (const auto& client : clients_) {
    if (client.id() == id) return client;
  }
  return std::nullopt;
}

std::vector<Client> ClientRegistry::List() const {
  std::lock_guard lock(mutex_);
  return clients_;
}

std::size_t ClientRegistry::Claim() {
  std::lock_guard lock(mutex_);
  std::size_t     claimed = 0;
  for (auto& client : clients_) {
    if (!client.controlled()) {
      client.set_controlled(true);
      ++claimed;
    }
  }
  return claimed;
}

std::optional<Client> ClientRegistry::FindSameOrigin() const {
  std::lock_guard lock(mutex_);
  for (const auto& client : clients_) {
    try {
      if (offline::util::SameOrigin(offline::util::ParseAbsoluteUrl(client.url()), origin_)) return client;
    } catch (const offline::util::InvalidArgument&) {
      continue;
    }
  }
  return std::nullopt;
}

Client ClientRegistry::FocusAndNavigate(const std::string& id, const std::string& url) {
  std::lock_guard lock(mutex_);
  for (auto& client : clients_) {
    if (client.id() != id) continue;
    client.set_url(Resolve(url));
    FocusUnlocked(&client);
    return client;
  }
  throw offline::util::NotFound("client not found: " + id);
}

Client ClientRegistry::OpenWindow(const std::string& url, bool controlled) {
  Client client;
  client.set_id(offline::util::GenerateUUIDString());
  client.set_url(Resolve(url));
  client.set_controlled(controlled);

  std::lock_guard lock(mutex_);
  clients_.push_back(client);
  FocusUnlocked(&clients_.back());
  return clients_.back();
}

bool ClientRegistry::IsControlled(const std::string& id) const {
  if (id.empty()) return true;
  const auto client = Get(id);
  return !client || client->controlled();
}

std::string ClientRegistry::Resolve(const std::string& url) const {
  return offline::util::ResolveUrl(url, origin_).ToString();
}

void ClientRegistry::FocusUnlocked(Client* target) {
  for (auto& client : clients_) {
    client.set_focused(false);
  }
  target->set_focused(true);
}

} // namespace offline::clients

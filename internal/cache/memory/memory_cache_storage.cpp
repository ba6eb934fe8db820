#include "memory_cache_storage.hpp"

#include <algorithm>
#include <mutex>

namespace offline::cache {

using offline::worker::v1::HttpResponse;

MemoryCacheStorage::Entries& MemoryCacheStorage::OpenUnlocked(const std::string& generation) {
  auto [it, inserted] = generations_.try_emplace(generation);
  if (inserted) order_.push_back(generation);
  return it->second;
}

void MemoryCacheStorage::Open(const std::string& generation) {
  std::unique_lock lock(mutex_);
  OpenUnlocked(generation);
}

bool MemoryCacheStorage::Has(const std::string& generation) const {
  std::shared_lock lock(mutex_);
  return generations_.count(generation) > 0;
}

std::vector<std::string> MemoryCacheStorage::Keys() const {
  std::shared_lock lock(mutex_);
  return order_;
}

bool MemoryCacheStorage::Delete(const std::string& generation) {
  std::unique_lock lock(mutex_);

  if (generations_.erase(generation) == 0) return false;
  order_.erase(std::remove(order_.begin(), order_.end(), generation), order_.end());
  return true;
}

std::optional<HttpResponse> MemoryCacheStorage::Match(const std::string& generation, const std::string& key) const {
  std::shared_lock lock(mutex_);

  auto gen = generations_.find(generation);
  if (gen == generations_.end()) return std::nullopt;

  auto it = gen->second.find(key);
  if (it == gen->second.end()) return std::nullopt;

  return it->second;
}

void MemoryCacheStorage::Put(const std::string& generation, const std::string& key, const HttpResponse& response) {
  std::unique_lock lock(mutex_);
  OpenUnlocked(generation)[key] = response;
}

bool MemoryCacheStorage::PutExisting(const std::string& generation, const std::string& key, const HttpResponse& response) {
  std::unique_lock lock(mutex_);

  auto gen = generations_.find(generation);
  if (gen == generations_.end()) return false;

  gen->second[key] = response;
  return true;
}

void MemoryCacheStorage::PutAll(const std::string& generation, const std::vector<std::pair<std::string, HttpResponse>>& entries) {
  Entries staged;
  for (const auto& [key, response] : entries) staged[key] = response;

  std::unique_lock lock(mutex_);
  OpenUnlocked(generation) = std::move(staged);
}

std::vector<std::string> MemoryCacheStorage::EntryKeys(const std::string& generation) const {
  std::shared_lock lock(mutex_);

  std::vector<std::string> keys;
  auto gen = generations_.find(generation);
  if (gen == generations_.end()) return keys;

  keys.reserve(gen->second.size());
  for (const auto& [key, _] : gen->second) keys.push_back(key);
  return keys;
}

std::size_t MemoryCacheStorage::DeleteMatching(const std::string& generation, const std::string& key_prefix) {
  std::unique_lock lock(mutex_);

  auto gen = generations_.find(generation);
  if (gen == generations_.end()) return 0;

  std::size_t removed = 0;
  auto& entries = gen->second;
  for (auto it = entries.lower_bound(key_prefix); it != entries.end() && it->first.compare(0, key_prefix.size(), key_prefix) == 0;) {
    it = entries.erase(it);
    ++removed;
  }
  return removed;
}

} // namespace offline::cache

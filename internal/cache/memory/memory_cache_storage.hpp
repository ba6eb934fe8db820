#pragma once

#include <map>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/cache/cache_storage.hpp"

namespace offline::cache {

/*
  MEMORY cache backend.

  Thread safety:
    - shared reads
    - exclusive writes
*/

class MemoryCacheStorage final : public CacheStorage {
public:
  MemoryCacheStorage() = default;
  ~MemoryCacheStorage() override = default;

  void Open(const std::string& generation) override;
  bool Has(const std::string& generation) const override;
  std::vector<std::string> Keys() const override;
  bool Delete(const std::string& generation) override;

  std::optional<offline::worker::v1::HttpResponse>
  Match(const std::string& generation, const std::string& key) const override;

  void Put(const std::string& generation,
           const std::string& key,
           const offline::worker::v1::HttpResponse& response) override;

  bool PutExisting(const std::string& generation,
                   const std::string& key,
                   const offline::worker::v1::HttpResponse& response) override;

  void PutAll(const std::string& generation,
              const std::vector<std::pair<std::string, offline::worker::v1::HttpResponse>>& entries) override;

  std::vector<std::string> EntryKeys(const std::string& generation) const override;

  std::size_t DeleteMatching(const std::string& generation, const std::string& key_prefix) override;

private:
  using Entries = std::map<std::string, offline::worker::v1::HttpResponse>;

  Entries& OpenUnlocked(const std::string& generation);

  mutable std::shared_mutex mutex_;
  std::vector<std::string> order_;
  std::unordered_map<std::string, Entries> generations_;
};

} // namespace offline::cache

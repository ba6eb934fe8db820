#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "offline/worker/v1/http.pb.h"

namespace offline::cache {

/*
  Generation-scoped response store.

  A generation is a named, versioned bucket ("static@v3", "dynamic@v3").
  Each entry maps a request identity (see RequestKey) to an immutable
  response snapshot; Put replaces, never mutates.

  Every call is individually atomic. Callers composing a read with a later
  write get no atomicity across the two.

  Implementations:
    MEMORY  → process-local maps
    SQLITE  → single-file database, survives restarts

  Failures are reported as util::StorageError.
*/

class CacheStorage {
 public:
  virtual ~CacheStorage() = default;

  // ------------------------------------------------------------------
  // Generations
  // ------------------------------------------------------------------
  /*
    Create the generation if it does not exist yet. Idempotent.
  */
  virtual void Open(const std::string& generation) = 0;

  virtual bool Has(const std::string& generation) const = 0;

  /*
    Names of every existing generation, in creation order.
  */
  virtual std::vector<std::string> Keys() const = 0;

  /*
    Drop the generation and all of its entries.
    Returns false when it did not exist.
  */
  virtual bool Delete(const std::string& generation) = 0;

  // ------------------------------------------------------------------
  // Entries
  // ------------------------------------------------------------------
  virtual std::optional<offline::worker::v1::HttpResponse> Match(const std::string& generation, const std::string& key) const = 0;

  /*
    Store a snapshot, creating the generation when missing.
  */
  virtual void Put(const std::string& generation, const std::string& key, const offline::worker::v1::HttpResponse& response) = 0;

  /*
    Store a snapshot only while `generation` exists. Returns false, writing
    nothing, once the generation has been deleted: a late write-back never
    resurrects a retired generation.
  */
  virtual bool PutExisting(const std::string&                       generation,
                           const std::string&                       key,
                           const offline::worker::v1::HttpResponse& response) = 0;

  /*
    Atomically create `generation` holding exactly `entries`. Used by
    pre-warm so a partially filled generation is never observable.
  */
  virtual void PutAll(const std::string&                                                          generation,
                      const std::vector<std::pair<std::string, offline::worker::v1::HttpResponse>>& entries) = 0;

  virtual std::vector<std::string> EntryKeys(const std::string& generation) const = 0;

  /*
    Remove entries whose key starts with `key_prefix`. Returns the count.
  */
  virtual std::size_t DeleteMatching(const std::string& generation, const std::string& key_prefix) = 0;
};

using CacheStoragePtr = std::shared_ptr<CacheStorage>;

} // namespace offline::cache

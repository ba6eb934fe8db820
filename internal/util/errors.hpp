#pragma once

#include <stdexcept>
#include <string>

namespace offline::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  Transport-level failure talking to the upstream (connect, write, read).
  A received non-2xx response is not a NetworkError.
*/
class NetworkError : public std::runtime_error {
 public:
  explicit NetworkError(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  Cache or sync-state storage failure (quota, I/O, corruption).
*/
class StorageError : public std::runtime_error {
 public:
  explicit StorageError(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  Pre-warm of a new cache generation failed; the install attempt is abandoned.
*/
class InstallFailed : public std::runtime_error {
 public:
  explicit InstallFailed(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  A background sync operation reported failure; the host is expected to
  schedule a retry.
*/
class SyncFailed : public std::runtime_error {
 public:
  explicit SyncFailed(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  The caller abandoned the interception before the network was contacted.
*/
class Cancelled : public std::runtime_error {
 public:
  explicit Cancelled(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace offline::util

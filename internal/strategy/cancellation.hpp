#pragma once

#include <functional>
#include <utility>

namespace offline::strategy {

/*
  Per-interception cancellation signal. Polled, never pushed: the host
  adapter supplies a predicate (e.g. grpc::ServerContext::IsCancelled).
*/
class CancellationToken {
 public:
  CancellationToken() = default;
  explicit CancellationToken(std::function<bool()> check) : check_(std::move(check)) {
  }

  bool IsCancelled() const {
    return check_ && check_();
  }

 private:
  std::function<bool()> check_;
};

} // namespace offline::strategy

#pragma once

#include <cstdint>

#include "offline/worker/v1/worker_service.pb.h"

namespace offline::lifecycle {

enum class LifecycleState : std::uint8_t {
  kUnspecified = 0,
  kInstalling  = 1,
  kInstalled   = 2, // waiting
  kActivating  = 3,
  kActive      = 4,
  kRedundant   = 5,
};

constexpr bool IsTerminal(LifecycleState state) {
  return state == LifecycleState::kRedundant;
}

constexpr bool CanTransition(LifecycleState from, LifecycleState to) {
  if (IsTerminal(from)) {
    return false;
  }
  if (to == LifecycleState::kRedundant) {
    return true;
  }
  return static_cast<std::uint8_t>(to) == static_cast<std::uint8_t>(from) + 1;
}

constexpr offline::worker::v1::LifecycleState ToProto(LifecycleState state) {
  return static_cast<offline::worker::v1::LifecycleState>(static_cast<int>(state));
}

const char* ToString(LifecycleState state);

} // namespace offline::lifecycle

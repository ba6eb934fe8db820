#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace offline::util {

/*
  UUID helpers

  Used for window client ids and outbox action ids.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

inline std::string GenerateUUIDString() {
  return ToString(GenerateUUID());
}

} // namespace offline::util

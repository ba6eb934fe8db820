#include "time.hpp"

namespace offline::util {

TimePoint Now() {
  return Clock::now();
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

uint64_t NowUnixMillis() {
  return ToUnixMillis(Now());
}

} // namespace offline::util

#include "time.hpp"

namespace lifebank::util {

Timestamp SystemClock::Now() const {
  return ToUnixSeconds(std::chrono::system_clock::now());
}

Timestamp ToUnixSeconds(std::chrono::system_clock::time_point tp) {
  return static_cast<Timestamp>(std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count());
}

} // namespace lifebank::util

#include "horaid/core/clock.h"

#include "horaid/core/time.h"

namespace horaid::core {

std::int64_t SystemClock::now_unix_millis() {
  return to_unix_millis(now_utc());
}

std::int64_t FixedClock::now_unix_millis() {
  return unix_millis_;
}

}  // namespace horaid::core

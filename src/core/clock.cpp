#include "snowflake/core/clock.h"

#include "snowflake/core/time.h"

namespace snowflake::core {

std::int64_t SystemClock::now_unix_millis() {
  return to_unix_millis(now_utc());
}

std::int64_t ManualClock::now_unix_millis() {
  return millis_.load(std::memory_order_acquire);
}

void ManualClock::set(std::int64_t millis) {
  millis_.store(millis, std::memory_order_release);
}

void ManualClock::advance(std::int64_t delta_millis) {
  millis_.fetch_add(delta_millis, std::memory_order_acq_rel);
}

}  // namespace snowflake::core

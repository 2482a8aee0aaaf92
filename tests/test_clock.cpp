#include "snowflake/core/clock.h"
#include "snowflake/core/time.h"

#include <catch2/catch_test_macros.hpp>

#include <cstdint>

using namespace snowflake::core;

TEST_CASE("SystemClock: reads current Unix milliseconds", "[clock]") {
  SystemClock clock;
  const std::int64_t before = to_unix_millis(now_utc());
  const std::int64_t reading = clock.now_unix_millis();
  const std::int64_t after = to_unix_millis(now_utc());

  CHECK(reading >= before);
  CHECK(reading <= after);
  // Sanity: after 2021-01-01T00:00:00Z
  CHECK(reading > 1609459200000);
}

TEST_CASE("ManualClock: time moves only when told to", "[clock]") {
  ManualClock clock(5000);
  CHECK(clock.now_unix_millis() == 5000);
  CHECK(clock.now_unix_millis() == 5000);

  clock.advance(3);
  CHECK(clock.now_unix_millis() == 5003);

  clock.set(10);
  CHECK(clock.now_unix_millis() == 10);

  clock.advance(-4);
  CHECK(clock.now_unix_millis() == 6);
}

TEST_CASE("time: unix millis round-trip through Timestamp", "[clock][time]") {
  const std::int64_t millis = 1609459200123;
  CHECK(to_unix_millis(from_unix_millis(millis)) == millis);
}

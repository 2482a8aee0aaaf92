#include "snowflake/id/generator.h"

#include <thread>
#include <utility>

namespace snowflake::id {

namespace {

std::shared_ptr<core::IClock> default_clock() {
  static const auto clock = std::make_shared<core::SystemClock>();
  return clock;
}

}  // namespace

Generator::CreateResult Generator::create(std::uint32_t node, std::optional<std::int64_t> epoch_ms,
                                          std::shared_ptr<core::IClock> clock) {
  if (node > kNodeMax) {
    return CreateResult::err(GeneratorError::kMachineIdOutOfRange);
  }
  if (!clock) {
    clock = default_clock();
  }
  // Constructor is private, so std::make_shared cannot reach it.
  std::shared_ptr<Generator> generator(new Generator(static_cast<std::uint16_t>(node),
                                                     epoch_ms.value_or(kDefaultEpochMs),
                                                     std::move(clock)));
  return CreateResult::ok(std::move(generator));
}

Generator::Generator(std::uint16_t node, std::int64_t epoch_ms,
                     std::shared_ptr<core::IClock> clock)
    : node_(node), epoch_ms_(epoch_ms), clock_(std::move(clock)) {}

Generator::GenerateResult Generator::generate() {
  const std::int64_t now = clock_->now_unix_millis();
  if (now < epoch_ms_) {
    return GenerateResult::err(GeneratorError::kClockMovedBackwards);
  }

  std::uint64_t observed = state_.load(std::memory_order_acquire);

  for (;;) {
    const auto [last_timestamp, last_sequence] = unpack_state(observed);
    if (now < last_timestamp) {
      return GenerateResult::err(GeneratorError::kClockMovedBackwards);
    }

    std::int64_t timestamp = now;
    std::uint64_t sequence = 0;
    if (now == last_timestamp) {
      sequence = (last_sequence + 1) & kSequenceMask;
      if (sequence == 0) {
        const auto next = wait_next_millis(last_timestamp);
        if (!next.has_value()) {
          return GenerateResult::err(next.error());
        }
        timestamp = next.value();
      }
    }

    // On failure compare_exchange_weak reloads observed; the decision above is
    // re-derived from the newer state with the same clock reading.
    if (state_.compare_exchange_weak(observed, pack_state(timestamp, sequence),
                                     std::memory_order_acq_rel, std::memory_order_acquire)) {
      return GenerateResult::ok(
          compose_id(static_cast<std::uint64_t>(timestamp - epoch_ms_), node_, sequence));
    }
  }
}

core::Result<std::int64_t, GeneratorError> Generator::wait_next_millis(
    std::int64_t last_timestamp) {
  using Millis = core::Result<std::int64_t, GeneratorError>;

  const auto start = std::chrono::steady_clock::now();
  for (;;) {
    const std::int64_t now = clock_->now_unix_millis();
    if (now > last_timestamp) {
      return Millis::ok(now);
    }
    if (std::chrono::steady_clock::now() - start > kSequenceWaitDeadline) {
      return Millis::err(GeneratorError::kSequenceOverflow);
    }
    std::this_thread::yield();
  }
}

}  // namespace snowflake::id

#pragma once

#include "snowflake/core/clock.h"
#include "snowflake/core/result.h"
#include "snowflake/id/generator_error.h"
#include "snowflake/id/layout.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>

namespace snowflake::id {

// Longest time generate() spins waiting for the clock to leave an exhausted millisecond.
constexpr std::chrono::milliseconds kSequenceWaitDeadline{5000};

// Generator mints 64-bit Snowflake IDs for one node.
//
// Thread-safe and lock-free: the last committed (timestamp, sequence) pair is
// packed into a single atomic word and advanced with compare-and-swap, so any
// number of threads may call generate() on a shared instance.
//
// node, epoch and clock are fixed at construction. Share the generator through
// std::shared_ptr; it is neither copyable nor movable.
class Generator final {
 public:
  using GenerateResult = core::Result<std::uint64_t, GeneratorError>;
  using CreateResult = core::Result<std::shared_ptr<Generator>, GeneratorError>;

  // create validates node (0..1023) and builds a generator.
  // epoch_ms defaults to kDefaultEpochMs; clock defaults to the system clock.
  // Fails with kMachineIdOutOfRange when node > kNodeMax.
  [[nodiscard]] static CreateResult create(std::uint32_t node,
                                           std::optional<std::int64_t> epoch_ms = std::nullopt,
                                           std::shared_ptr<core::IClock> clock = nullptr);

  ~Generator() = default;

  Generator(const Generator&) = delete;
  Generator& operator=(const Generator&) = delete;
  Generator(Generator&&) = delete;
  Generator& operator=(Generator&&) = delete;

  // generate returns the next ID, or
  //   kClockMovedBackwards if the clock reads earlier than the last committed
  //     timestamp (including a stale read racing another thread's commit) or
  //     earlier than the epoch;
  //   kSequenceOverflow if 4096 IDs were already minted this millisecond and
  //     the clock did not advance within kSequenceWaitDeadline.
  // No automatic retry is performed for either error.
  [[nodiscard]] GenerateResult generate();

  // parse splits an ID into its fields. Pure; needs no generator instance.
  // The returned timestamp is relative to the producing generator's epoch.
  [[nodiscard]] static ParsedId parse(std::uint64_t id) { return decompose_id(id); }

  [[nodiscard]] std::uint16_t node() const { return node_; }
  [[nodiscard]] std::int64_t epoch_ms() const { return epoch_ms_; }

 private:
  Generator(std::uint16_t node, std::int64_t epoch_ms, std::shared_ptr<core::IClock> clock);

  core::Result<std::int64_t, GeneratorError> wait_next_millis(std::int64_t last_timestamp);

  const std::uint16_t node_;
  const std::int64_t epoch_ms_;
  const std::shared_ptr<core::IClock> clock_;
  std::atomic<std::uint64_t> state_{0};
};

using GeneratorPtr = std::shared_ptr<Generator>;

}  // namespace snowflake::id

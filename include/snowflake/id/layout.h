#pragma once

// Snowflake ID bit layout, most to least significant:
//
//   [ 1 unused ][ 41 timestamp ][ 10 node ][ 12 sequence ]
//
// timestamp: milliseconds since the generator's epoch (~69 years of range)
// node:      generator identity, 0..1023
// sequence:  counter within one millisecond, 0..4095
//
// These constants are the wire contract for any consumer decoding IDs.

#include <compare>
#include <cstdint>
#include <utility>

namespace snowflake::id {

constexpr std::uint32_t kTimestampBits = 41;
constexpr std::uint32_t kNodeBits = 10;
constexpr std::uint32_t kSequenceBits = 12;

constexpr std::uint32_t kNodeShift = kSequenceBits;
constexpr std::uint32_t kTimestampShift = kNodeBits + kSequenceBits;

constexpr std::uint64_t kTimestampMask = (std::uint64_t{1} << kTimestampBits) - 1;
constexpr std::uint64_t kNodeMask = (std::uint64_t{1} << kNodeBits) - 1;
constexpr std::uint64_t kSequenceMask = (std::uint64_t{1} << kSequenceBits) - 1;

constexpr std::uint16_t kNodeMax = static_cast<std::uint16_t>(kNodeMask);          // 1023
constexpr std::uint16_t kSequenceMax = static_cast<std::uint16_t>(kSequenceMask);  // 4095

// 2021-01-01T00:00:00Z in milliseconds since the Unix epoch.
constexpr std::int64_t kDefaultEpochMs = 1609459200000;

static_assert(1 + kTimestampBits + kNodeBits + kSequenceBits == 64,
              "layout must fill a 64-bit word with one unused leading bit");

// ParsedId is the decoded form of an identifier.
// timestamp is relative to the originating generator's epoch, not absolute.
struct ParsedId {
  std::uint64_t timestamp{0};  // NOLINT(readability-identifier-naming)
  std::uint16_t node{0};       // NOLINT(readability-identifier-naming)
  std::uint16_t sequence{0};   // NOLINT(readability-identifier-naming)
  auto operator<=>(const ParsedId&) const = default;
};

// ── Packed generator state ──────────────────────────────────────────────────
// (last_timestamp_ms << 12) | last_sequence. The timestamp here is absolute
// (Unix milliseconds), so the pair can be compared and swapped as one word.

[[nodiscard]] constexpr std::uint64_t pack_state(std::int64_t timestamp_ms,
                                                 std::uint64_t sequence) {
  return (static_cast<std::uint64_t>(timestamp_ms) << kSequenceBits) | (sequence & kSequenceMask);
}

[[nodiscard]] constexpr std::pair<std::int64_t, std::uint64_t> unpack_state(std::uint64_t state) {
  return {static_cast<std::int64_t>(state >> kSequenceBits), state & kSequenceMask};
}

// ── Identifier encoding ─────────────────────────────────────────────────────

[[nodiscard]] constexpr std::uint64_t compose_id(std::uint64_t timestamp_since_epoch,
                                                 std::uint16_t node, std::uint64_t sequence) {
  return (timestamp_since_epoch << kTimestampShift) |
         (static_cast<std::uint64_t>(node) << kNodeShift) | (sequence & kSequenceMask);
}

[[nodiscard]] constexpr ParsedId decompose_id(std::uint64_t id) {
  return ParsedId{
      (id >> kTimestampShift) & kTimestampMask,
      static_cast<std::uint16_t>((id >> kNodeShift) & kNodeMask),
      static_cast<std::uint16_t>(id & kSequenceMask),
  };
}

// to_unix_millis recovers the absolute wall-clock millisecond of a parsed ID,
// given the epoch of the generator that produced it.
[[nodiscard]] constexpr std::int64_t to_unix_millis(const ParsedId& parsed, std::int64_t epoch_ms) {
  return static_cast<std::int64_t>(parsed.timestamp) + epoch_ms;
}

}  // namespace snowflake::id

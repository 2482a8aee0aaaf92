#pragma once

#include <cstdint>
#include <string_view>

namespace snowflake::id {

// GeneratorError enumerates every way ID generation can fail.
// Errors carry no payload; the caller decides whether to retry.
enum class GeneratorError : uint8_t {
  kMachineIdOutOfRange,  // create(): node > 1023
  kClockMovedBackwards,  // generate(): clock behind the last committed timestamp or the epoch
  kSequenceOverflow,     // generate(): next millisecond did not arrive within the wait deadline
};

// to_string returns a human-readable description of the error.
// The returned string_view is a string literal and is always valid.
[[nodiscard]] inline std::string_view to_string(GeneratorError e) {
  switch (e) {
    case GeneratorError::kMachineIdOutOfRange:
      return "Machine ID is out of range";
    case GeneratorError::kClockMovedBackwards:
      return "Clock moved backwards";
    case GeneratorError::kSequenceOverflow:
      return "Sequence overflow";
  }
  return "Unknown error";  // unreachable: all enumerators covered above
}

}  // namespace snowflake::id

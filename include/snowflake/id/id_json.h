#pragma once

#include "snowflake/id/generator_error.h"
#include "snowflake/id/layout.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace snowflake::id {

// GeneratorError <-> "MachineIdOutOfRange" | "ClockMovedBackwards" | "SequenceOverflow"
NLOHMANN_JSON_SERIALIZE_ENUM(GeneratorError,
                             {
                                 {GeneratorError::kMachineIdOutOfRange, "MachineIdOutOfRange"},
                                 {GeneratorError::kClockMovedBackwards, "ClockMovedBackwards"},
                                 {GeneratorError::kSequenceOverflow, "SequenceOverflow"},
                             })

/// ADL hooks so ParsedId works with nlohmann::json conversions
void to_json(nlohmann::json& j, const ParsedId& parsed);
void from_json(const nlohmann::json& j, ParsedId& parsed);

/// Describe an ID as {"id","timestamp","node","sequence"} plus "unix_ms" when
/// the producing generator's epoch is known.
[[nodiscard]] nlohmann::json describe_id(std::uint64_t id,
                                         std::optional<std::int64_t> epoch_ms = std::nullopt);

/// Serialize to stable JSON string (sorted keys, no whitespace)
[[nodiscard]] std::string describe_id_string(std::uint64_t id,
                                             std::optional<std::int64_t> epoch_ms = std::nullopt);

}  // namespace snowflake::id

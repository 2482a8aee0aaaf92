#pragma once

#include "snowflake/id/generator.h"

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

// GenerateCliConfig holds the parsed flags of `snowflake_cli generate`.
struct GenerateCliConfig {
  std::uint32_t node{0};                 // NOLINT(readability-identifier-naming)
  std::optional<std::int64_t> epoch_ms;  // NOLINT(readability-identifier-naming)
  std::uint64_t count{1};                // NOLINT(readability-identifier-naming)
  bool args_valid{true};                 // NOLINT(readability-identifier-naming)
};

// validate_generate_config checks the parsed flags before a generator is built.
// Returns: "" on success, non-empty error message on failure.
[[nodiscard]] std::string validate_generate_config(const GenerateCliConfig& config);

// execute_generate mints `count` IDs and prints one decimal ID per line to out.
// Stops at the first failure, reports it to err and returns 1.
int execute_generate(snowflake::id::Generator& generator, std::uint64_t count, std::ostream& out,
                     std::ostream& err);

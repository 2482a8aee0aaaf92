#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

// execute_parse decodes a decimal Snowflake ID and prints its fields as JSON.
// unix_ms is computed with epoch_ms, or the default epoch when absent.
// Returns 1 and reports to err when id_text is not a valid unsigned 64-bit integer.
int execute_parse(const std::string& id_text, std::optional<std::int64_t> epoch_ms,
                  std::ostream& out, std::ostream& err);

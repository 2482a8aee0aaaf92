#include "parse_logic.h"

#include "snowflake/id/id_json.h"
#include "snowflake/id/layout.h"

#include "shared/arg_parser.h"

int execute_parse(const std::string& id_text, std::optional<std::int64_t> epoch_ms,
                  std::ostream& out, std::ostream& err) {
  const auto id = snowflake::apps::parse_integer<std::uint64_t>(id_text);
  if (!id.has_value()) {
    err << "Error: invalid id '" << id_text << "' (expected an unsigned 64-bit integer)\n";
    return 1;
  }

  const auto json =
      snowflake::id::describe_id(id.value(), epoch_ms.value_or(snowflake::id::kDefaultEpochMs));
  out << json.dump(2) << "\n";
  return 0;
}

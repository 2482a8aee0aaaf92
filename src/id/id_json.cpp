#include "snowflake/id/id_json.h"

namespace snowflake::id {

void to_json(nlohmann::json& j, const ParsedId& parsed) {
  j = nlohmann::json{
      {"timestamp", parsed.timestamp},
      {"node", parsed.node},
      {"sequence", parsed.sequence},
  };
}

void from_json(const nlohmann::json& j, ParsedId& parsed) {
  j.at("timestamp").get_to(parsed.timestamp);
  j.at("node").get_to(parsed.node);
  j.at("sequence").get_to(parsed.sequence);
}

nlohmann::json describe_id(std::uint64_t id, std::optional<std::int64_t> epoch_ms) {
  const ParsedId parsed = decompose_id(id);

  nlohmann::json j = parsed;
  j["id"] = id;
  if (epoch_ms.has_value()) {
    j["unix_ms"] = to_unix_millis(parsed, epoch_ms.value());
  }
  return j;
}

std::string describe_id_string(std::uint64_t id, std::optional<std::int64_t> epoch_ms) {
  // nlohmann::json objects keep keys sorted, so dump() is stable
  return describe_id(id, epoch_ms).dump();
}

}  // namespace snowflake::id

#include "parse.h"

#include "parse_logic.h"
#include "shared/arg_parser.h"
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct ParseCliConfig {
  std::optional<std::int64_t> epoch_ms;  // NOLINT(readability-identifier-naming)
  bool args_valid{true};                 // NOLINT(readability-identifier-naming)
};

}  // namespace

int cmd_parse(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<snowflake::apps::Option<ParseCliConfig>> options = {
      {"--epoch", true, "Epoch of the generator that produced the id, in Unix milliseconds",
       [](ParseCliConfig& c, const std::string& v) {
         const auto epoch = snowflake::apps::parse_integer<std::int64_t>(v);
         if (!epoch.has_value()) {
           std::cerr << "Invalid --epoch: " << v << " (expected Unix milliseconds)\n";
           c.args_valid = false;
           return false;
         }
         c.epoch_ms = epoch.value();
         return true;
       }},
  };
  std::vector<std::string> positionals;
  const auto config = snowflake::apps::parse_options(argc, argv, options, 2, {}, &positionals);

  if (!config.args_valid) {
    return 1;
  }
  if (positionals.size() != 1) {
    std::cerr << "Usage: snowflake_cli parse <id> [--epoch <unix-ms>]\n";
    return 1;
  }

  return execute_parse(positionals.front(), config.epoch_ms, std::cout, std::cerr);
}

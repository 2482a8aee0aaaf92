#include "generate.h"

#include "snowflake/id/generator.h"

#include "generate_logic.h"
#include "shared/arg_parser.h"
#include <iostream>
#include <string>
#include <vector>

int cmd_generate(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  using snowflake::apps::parse_integer;

  const std::vector<snowflake::apps::Option<GenerateCliConfig>> options = {
      {"--node", true, "Node id of this generator (0-1023)",
       [](GenerateCliConfig& c, const std::string& v) {
         const auto node = parse_integer<std::uint32_t>(v);
         if (!node.has_value()) {
           std::cerr << "Invalid --node: " << v << " (expected an integer 0-1023)\n";
           c.args_valid = false;
           return false;
         }
         c.node = node.value();
         return true;
       }},
      {"--epoch", true, "Custom epoch in Unix milliseconds",
       [](GenerateCliConfig& c, const std::string& v) {
         const auto epoch = parse_integer<std::int64_t>(v);
         if (!epoch.has_value()) {
           std::cerr << "Invalid --epoch: " << v << " (expected Unix milliseconds)\n";
           c.args_valid = false;
           return false;
         }
         c.epoch_ms = epoch.value();
         return true;
       }},
      {"--count", true, "Number of IDs to generate",
       [](GenerateCliConfig& c, const std::string& v) {
         const auto count = parse_integer<std::uint64_t>(v);
         if (!count.has_value()) {
           std::cerr << "Invalid --count: " << v << "\n";
           c.args_valid = false;
           return false;
         }
         c.count = count.value();
         return true;
       }},
  };
  const auto config = snowflake::apps::parse_options(argc, argv, options, 2);

  const std::string config_error = validate_generate_config(config);
  if (!config_error.empty()) {
    std::cerr << config_error << "\n";
    return 1;
  }

  const auto created = snowflake::id::Generator::create(config.node, config.epoch_ms);
  if (!created.has_value()) {
    std::cerr << "Error: " << snowflake::id::to_string(created.error()) << " (--node "
              << config.node << ", valid: 0-" << snowflake::id::kNodeMax << ")\n";
    return 1;
  }

  return execute_generate(*created.value(), config.count, std::cout, std::cerr);
}

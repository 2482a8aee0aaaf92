#include "generate_logic.h"

#include "snowflake/id/generator_error.h"

std::string validate_generate_config(const GenerateCliConfig& config) {
  if (!config.args_valid) {
    return "Error: invalid arguments (see messages above)";
  }
  if (config.count == 0) {
    return "Error: --count must be at least 1";
  }
  return "";
}

int execute_generate(snowflake::id::Generator& generator, std::uint64_t count, std::ostream& out,
                     std::ostream& err) {
  for (std::uint64_t i = 0; i < count; ++i) {
    const auto result = generator.generate();
    if (!result.has_value()) {
      err << "Error: " << snowflake::id::to_string(result.error()) << " (after " << i
          << " ids)\n";
      return 1;
    }
    out << result.value() << "\n";
  }
  return 0;
}

#include "snowflake/core/version.h"

#include "commands/generate.h"
#include "commands/parse.h"
#include <iostream>
#include <string>

namespace {

void print_usage() {
  std::cerr << "snowflake_cli v" << snowflake::core::kBuildVersion << "\n"
            << "Usage:\n"
            << "  snowflake_cli generate [--node <0-1023>] [--epoch <unix-ms>] [--count <n>]\n"
            << "  snowflake_cli parse <id> [--epoch <unix-ms>]\n"
            << "  snowflake_cli version\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage();
    return 1;
  }

  const std::string subcommand = argv[1];
  if (subcommand == "generate") {
    return cmd_generate(argc, argv);
  }
  if (subcommand == "parse") {
    return cmd_parse(argc, argv);
  }
  if (subcommand == "version") {
    std::cout << snowflake::core::kBuildVersion << "\n";
    return 0;
  }

  std::cerr << "Unknown subcommand: " << subcommand << "\n";
  print_usage();
  return 1;
}

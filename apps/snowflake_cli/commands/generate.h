#pragma once

// cmd_generate: mint Snowflake IDs and print them one per line.
// Usage: snowflake_cli generate [--node <0-1023>] [--epoch <unix-ms>] [--count <n>]
int cmd_generate(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

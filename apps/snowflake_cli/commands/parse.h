#pragma once

// cmd_parse: decode a Snowflake ID into timestamp, node and sequence.
// Usage: snowflake_cli parse <id> [--epoch <unix-ms>]
int cmd_parse(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

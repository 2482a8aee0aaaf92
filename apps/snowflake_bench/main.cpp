#include "snowflake/id/generator.h"

#include "shared/arg_parser.h"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace {

struct BenchConfig {
  std::uint32_t node{1};     // NOLINT(readability-identifier-naming)
  std::uint32_t seconds{1};  // NOLINT(readability-identifier-naming)
  std::uint32_t threads{4};  // NOLINT(readability-identifier-naming)
  bool args_valid{true};     // NOLINT(readability-identifier-naming)
};

struct Counts {
  std::uint64_t ok{0};      // NOLINT(readability-identifier-naming)
  std::uint64_t errors{0};  // NOLINT(readability-identifier-naming)
};

// Generate for `duration` on the calling thread.
Counts run_for(snowflake::id::Generator& generator, std::chrono::seconds duration) {
  Counts counts;
  const auto start = std::chrono::steady_clock::now();
  while (std::chrono::steady_clock::now() - start < duration) {
    if (generator.generate().has_value()) {
      ++counts.ok;
    } else {
      ++counts.errors;
    }
  }
  return counts;
}

// Spawn `threads` workers sharing one generator, each generating for `duration`.
Counts run_threads(const snowflake::id::GeneratorPtr& generator, std::uint32_t threads,
                   std::chrono::seconds duration) {
  std::atomic<std::uint64_t> ok{0};
  std::atomic<std::uint64_t> errors{0};

  std::vector<std::thread> workers;
  workers.reserve(threads);
  for (std::uint32_t t = 0; t < threads; ++t) {
    workers.emplace_back([generator, duration, &ok, &errors] {
      const Counts c = run_for(*generator, duration);
      ok.fetch_add(c.ok, std::memory_order_relaxed);
      errors.fetch_add(c.errors, std::memory_order_relaxed);
    });
  }
  for (auto& w : workers) {
    w.join();
  }
  return Counts{ok.load(), errors.load()};
}

bool set_positive(std::uint32_t& field, const std::string& flag, const std::string& v) {
  const auto parsed = snowflake::apps::parse_integer<std::uint32_t>(v);
  if (!parsed.has_value() || parsed.value() == 0) {
    std::cerr << "Invalid " << flag << ": " << v << " (expected a positive integer)\n";
    return false;
  }
  field = parsed.value();
  return true;
}

}  // namespace

int main(int argc, char* argv[]) {
  const std::vector<snowflake::apps::Option<BenchConfig>> options = {
      {"--node", true, "Node id (0-1023)",
       [](BenchConfig& c, const std::string& v) {
         const auto node = snowflake::apps::parse_integer<std::uint32_t>(v);
         if (!node.has_value()) {
           std::cerr << "Invalid --node: " << v << "\n";
           c.args_valid = false;
           return false;
         }
         c.node = node.value();
         return true;
       }},
      {"--seconds", true, "Duration of each run",
       [](BenchConfig& c, const std::string& v) {
         c.args_valid = set_positive(c.seconds, "--seconds", v) && c.args_valid;
         return c.args_valid;
       }},
      {"--threads", true, "Worker threads for the shared-generator run",
       [](BenchConfig& c, const std::string& v) {
         c.args_valid = set_positive(c.threads, "--threads", v) && c.args_valid;
         return c.args_valid;
       }},
  };
  const auto config = snowflake::apps::parse_options(argc, argv, options);
  if (!config.args_valid) {
    return 1;
  }

  const auto created = snowflake::id::Generator::create(config.node);
  if (!created.has_value()) {
    std::cerr << "Error: " << snowflake::id::to_string(created.error()) << "\n";
    return 1;
  }
  const std::chrono::seconds duration{config.seconds};

  // Fresh generator per run.
  const Counts single = run_for(*created.value(), duration);
  std::cout << "single thread: " << single.ok / config.seconds << " ids/s (" << single.errors
            << " errors)\n";

  const auto shared = snowflake::id::Generator::create(config.node);
  if (!shared.has_value()) {
    std::cerr << "Error: " << snowflake::id::to_string(shared.error()) << "\n";
    return 1;
  }
  const Counts multi = run_threads(shared.value(), config.threads, duration);
  std::cout << config.threads << " threads:     " << multi.ok / config.seconds << " ids/s ("
            << multi.errors << " errors)\n";

  if (single.errors + multi.errors > 0) {
    std::cerr << "WARNING: errors during generation usually mean the system clock was adjusted "
                 "or the per-millisecond sequence was exhausted for longer than the wait "
                 "deadline.\n";
  }
  return 0;
}

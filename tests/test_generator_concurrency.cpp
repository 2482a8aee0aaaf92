#include "snowflake/core/clock.h"
#include "snowflake/id/generator.h"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_set>
#include <vector>

using namespace snowflake;
using id::Generator;

namespace {

struct ThreadedRun {
  std::vector<std::uint64_t> ids;  // NOLINT(readability-identifier-naming)
  std::size_t errors{0};           // NOLINT(readability-identifier-naming)
};

// Spawn `threads` workers sharing `generator`, each calling generate() `per_thread` times.
ThreadedRun run_threads(const id::GeneratorPtr& generator, int threads, int per_thread) {
  std::mutex mu;
  ThreadedRun run;
  std::atomic<std::size_t> errors{0};

  std::vector<std::thread> workers;
  workers.reserve(static_cast<std::size_t>(threads));
  for (int t = 0; t < threads; ++t) {
    workers.emplace_back([generator, per_thread, &mu, &run, &errors] {
      std::vector<std::uint64_t> local;
      local.reserve(static_cast<std::size_t>(per_thread));
      for (int i = 0; i < per_thread; ++i) {
        const auto result = generator->generate();
        if (result.has_value()) {
          local.push_back(result.value());
        } else {
          errors.fetch_add(1, std::memory_order_relaxed);
        }
      }
      const std::lock_guard<std::mutex> lock(mu);
      run.ids.insert(run.ids.end(), local.begin(), local.end());
    });
  }
  for (auto& w : workers) {
    w.join();
  }
  run.errors = errors.load();
  return run;
}

std::size_t count_duplicates(const std::vector<std::uint64_t>& ids) {
  std::unordered_set<std::uint64_t> seen;
  std::size_t duplicates = 0;
  for (const auto v : ids) {
    if (!seen.insert(v).second) {
      ++duplicates;
    }
  }
  return duplicates;
}

}  // namespace

// ── Uniqueness ──────────────────────────────────────────────────────────────

TEST_CASE("Generator: shared across 10 threads x 1000 ids produces no duplicates",
          "[generator][concurrency]") {
  const auto created = Generator::create(1);
  REQUIRE(created.has_value());

  const auto run = run_threads(created.value(), 10, 1000);

  // Contention may surface as kClockMovedBackwards, never as a duplicate.
  CHECK(run.ids.size() + run.errors == 10000);
  CHECK(count_duplicates(run.ids) == 0);
  CHECK_FALSE(run.ids.empty());
}

TEST_CASE("Generator: 4 threads x 250 ids within one millisecond all succeed",
          "[generator][concurrency]") {
  const std::int64_t now = id::kDefaultEpochMs + 77;
  auto clock = std::make_shared<core::ManualClock>(now);
  const auto created = Generator::create(8, std::nullopt, clock);
  REQUIRE(created.has_value());

  auto run = run_threads(created.value(), 4, 250);

  REQUIRE(run.errors == 0);
  REQUIRE(run.ids.size() == 1000);
  CHECK(count_duplicates(run.ids) == 0);

  // Every sequence 0..999 was claimed exactly once within millisecond 77.
  std::sort(run.ids.begin(), run.ids.end());
  for (std::size_t i = 0; i < run.ids.size(); ++i) {
    const auto parsed = Generator::parse(run.ids[i]);
    CHECK(parsed.timestamp == 77);
    CHECK(parsed.node == 8);
    CHECK(parsed.sequence == i);
  }
}

TEST_CASE("Generator: exhausting a millisecond across threads rolls into the next one",
          "[generator][concurrency]") {
  const std::int64_t start = id::kDefaultEpochMs + 500;
  auto clock = std::make_shared<core::ManualClock>(start);
  const auto created = Generator::create(3, std::nullopt, clock);
  REQUIRE(created.has_value());
  const auto generator = created.value();

  // Waiters spin in the busy-wait until this thread moves the clock forward.
  std::atomic<bool> done{false};
  std::thread ticker([&clock, &done] {
    while (!done.load()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
      clock->advance(1);
    }
  });

  const auto run = run_threads(generator, 4, 3000);
  done.store(true);
  ticker.join();

  CHECK(run.ids.size() + run.errors == 12000);
  CHECK(count_duplicates(run.ids) == 0);
  for (const auto v : run.ids) {
    CHECK(Generator::parse(v).node == 3);
  }
}

// ── Throughput sanity ───────────────────────────────────────────────────────

TEST_CASE("Generator: single thread for one second yields increasing ids",
          "[generator][throughput]") {
  const auto created = Generator::create(1);
  REQUIRE(created.has_value());
  auto& generator = *created.value();

  std::uint64_t count = 0;
  std::uint64_t prev = 0;
  bool increasing = true;
  const auto start = std::chrono::steady_clock::now();
  while (std::chrono::steady_clock::now() - start < std::chrono::seconds(1)) {
    const auto result = generator.generate();
    if (!result.has_value()) {
      continue;
    }
    // Strictly increasing from one generator implies no duplicates.
    increasing = increasing && result.value() > prev;
    prev = result.value();
    ++count;
  }

  CHECK(count > 0);
  CHECK(increasing);
}

TEST_CASE("Generator: handle copies share one state", "[generator][concurrency]") {
  auto clock = std::make_shared<core::ManualClock>(id::kDefaultEpochMs);
  const auto created = Generator::create(0, std::nullopt, clock);
  REQUIRE(created.has_value());

  id::GeneratorPtr a = created.value();
  id::GeneratorPtr b = a;

  const auto first = a->generate();
  const auto second = b->generate();
  REQUIRE(first.has_value());
  REQUIRE(second.has_value());
  CHECK(Generator::parse(first.value()).sequence == 0);
  CHECK(Generator::parse(second.value()).sequence == 1);
}

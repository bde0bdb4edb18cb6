/**
 * @file time-bench.cpp
 * @brief Per-call cost of direct and cached clock reads.
 *
 * Times Instant::now(), CompactEpoch::now(), system_clock::now() and the
 * RefreshCache reads with configurable parameters:
 *  - Iterations per measured read
 *  - Refresh interval of the cache under test
 */

#include "src/cache/inc/ReadBench.hpp"
#include "src/helpers/inc/Args.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>

namespace args = timecache::helpers::args;
namespace cache = timecache::cache;

namespace {

/// Argument keys.
enum ArgKey : std::uint8_t {
  ARG_HELP = 0,
  ARG_JSON = 1,
  ARG_ITERATIONS = 2,
  ARG_INTERVAL = 3,
  ARG_QUICK = 4,
  ARG_THOROUGH = 5,
};

/// Tool description for --help.
constexpr std::string_view DESCRIPTION =
    "Measure the per-call cost of direct clock reads against cached reads.";

/// Build argument definitions.
args::ArgMap buildArgMap() {
  args::ArgMap map;
  map[ARG_HELP] = {"--help", 0, false, "Show this help message"};
  map[ARG_JSON] = {"--json", 0, false, "Output in JSON format"};
  map[ARG_ITERATIONS] = {"--iterations", 1, false, "Calls per measured read (default: 100000)"};
  map[ARG_INTERVAL] = {"--interval", 1, false, "Cache refresh interval in ms (default: 100)"};
  map[ARG_QUICK] = {"--quick", 0, false, "Quick measurement preset (10000 iterations)"};
  map[ARG_THOROUGH] = {"--thorough", 0, false, "Thorough measurement preset (1000000 iterations)"};
  return map;
}

/* ----------------------------- Human Output ----------------------------- */

void printHuman(const cache::ReadCostStats& stats) {
  fmt::print("=== Clock Read Cost ===\n\n");

  fmt::print("Configuration:\n");
  fmt::print("  Iterations:       {}\n", stats.iterations);
  fmt::print("  Refresh interval: {} ms\n", stats.refreshInterval.count());

  fmt::print("\n{:<24}  {:>10}  {:>8}\n", "Read", "ns/call", "bytes");
  fmt::print("{:<24}  {:>10.1f}  {:>8}\n", "Instant::now()", stats.instantNowNs, stats.instantBytes);
  fmt::print("{:<24}  {:>10.1f}  {:>8}\n", "CompactEpoch::now()", stats.compactEpochNowNs,
             stats.compactEpochBytes);
  fmt::print("{:<24}  {:>10.1f}  {:>8}\n", "system_clock::now()", stats.systemClockNowNs,
             stats.timePointBytes);
  fmt::print("{:<24}  {:>10.1f}  {:>8}\n", "cachedNow()", stats.cachedNowNs, stats.instantBytes);
  fmt::print("{:<24}  {:>10.1f}  {:>8}\n", "cachedEpoch()", stats.cachedEpochNs, stats.compactEpochBytes);

  fmt::print("\nAssessment:\n");
  fmt::print("  Cached speedup: {:.1f}x", stats.cachedSpeedup());
  if (stats.cacheIsFaster()) {
    fmt::print(" \033[32m[CACHE FASTER]\033[0m\n");
  } else {
    fmt::print(" \033[33m[NO GAIN]\033[0m\n");
  }
}

/* ----------------------------- JSON Output ----------------------------- */

void printJson(const cache::ReadCostStats& stats) {
  fmt::print("{{\n");

  fmt::print("  \"config\": {{\n");
  fmt::print("    \"iterations\": {},\n", stats.iterations);
  fmt::print("    \"refreshIntervalMs\": {}\n", stats.refreshInterval.count());
  fmt::print("  }},\n");

  fmt::print("  \"costNs\": {{\n");
  fmt::print("    \"instantNow\": {:.1f},\n", stats.instantNowNs);
  fmt::print("    \"compactEpochNow\": {:.1f},\n", stats.compactEpochNowNs);
  fmt::print("    \"systemClockNow\": {:.1f},\n", stats.systemClockNowNs);
  fmt::print("    \"cachedNow\": {:.1f},\n", stats.cachedNowNs);
  fmt::print("    \"cachedEpoch\": {:.1f}\n", stats.cachedEpochNs);
  fmt::print("  }},\n");

  fmt::print("  \"footprintBytes\": {{\n");
  fmt::print("    \"instant\": {},\n", stats.instantBytes);
  fmt::print("    \"compactEpoch\": {},\n", stats.compactEpochBytes);
  fmt::print("    \"timePoint\": {}\n", stats.timePointBytes);
  fmt::print("  }},\n");

  fmt::print("  \"assessment\": {{\n");
  fmt::print("    \"cachedSpeedup\": {:.2f},\n", stats.cachedSpeedup());
  fmt::print("    \"cacheIsFaster\": {}\n", stats.cacheIsFaster());
  fmt::print("  }}\n");

  fmt::print("}}\n");
}

} // namespace

/* ----------------------------- Main ----------------------------- */

int main(int argc, char* argv[]) {
  const args::ArgMap ARG_MAP = buildArgMap();
  args::ParsedArgs pargs;
  bool jsonOutput = false;

  cache::ReadBenchConfig config;

  if (argc > 1) {
    std::vector<std::string_view> argList;
    argList.reserve(static_cast<std::size_t>(argc - 1));
    for (int i = 1; i < argc; ++i) {
      argList.emplace_back(argv[i]);
    }

    std::string error;
    if (!args::parseArgs(argList, ARG_MAP, pargs, error)) {
      fmt::print(stderr, "Error: {}\n\n", error);
      args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
      return 1;
    }

    if (args::hasFlag(pargs, ARG_HELP)) {
      args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
      return 0;
    }

    jsonOutput = args::hasFlag(pargs, ARG_JSON);

    // Presets
    if (args::hasFlag(pargs, ARG_QUICK)) {
      config = cache::ReadBenchConfig::quick();
    }
    if (args::hasFlag(pargs, ARG_THOROUGH)) {
      config = cache::ReadBenchConfig::thorough();
    }

    // Custom options override presets
    const std::optional<std::uint64_t> ITERATIONS =
        args::unsignedValue(pargs, ARG_ITERATIONS, cache::MIN_BENCH_ITERATIONS, 1'000'000'000, error);
    const std::optional<std::uint64_t> INTERVAL = args::unsignedValue(pargs, ARG_INTERVAL, 1, 60'000, error);
    if (!error.empty()) {
      fmt::print(stderr, "Error: {}\n\n", error);
      args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
      return 1;
    }
    if (ITERATIONS) {
      config.iterations = static_cast<std::size_t>(*ITERATIONS);
    }
    if (INTERVAL) {
      config.refreshInterval = std::chrono::milliseconds{static_cast<std::int64_t>(*INTERVAL)};
    }
  }

  if (!jsonOutput) {
    fmt::print("Running read cost benchmark...\n");
    fmt::print("  Iterations: {}, Interval: {} ms\n\n", config.iterations, config.refreshInterval.count());
  }

  const cache::ReadCostStats STATS = cache::measureReadCost(config);

  if (jsonOutput) {
    printJson(STATS);
  } else {
    printHuman(STATS);
  }

  return 0;
}

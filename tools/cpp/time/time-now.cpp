/**
 * @file time-now.cpp
 * @brief Print the current time as each representation reports it.
 *
 * Shows side by side:
 *  - CompactEpoch::now() (direct 32-bit read)
 *  - RefreshCache::cachedEpoch() and cachedUnixNanos() (cached reads)
 *  - std::chrono::system_clock seconds (baseline)
 *
 * With --wait the cached values are read after sleeping, which shows how far
 * they lag a direct read.
 */

#include "src/cache/inc/RefreshCache.hpp"
#include "src/helpers/inc/Args.hpp"
#include "src/time/inc/CompactEpoch.hpp"
#include "src/time/inc/Duration.hpp"
#include "src/time/inc/Instant.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <fmt/core.h>

namespace args = timecache::helpers::args;
namespace cache = timecache::cache;
namespace tctime = timecache::time;

namespace {

/// Argument keys.
enum ArgKey : std::uint8_t {
  ARG_HELP = 0,
  ARG_JSON = 1,
  ARG_INTERVAL = 2,
  ARG_WAIT = 3,
};

/// Tool description for --help.
constexpr std::string_view DESCRIPTION =
    "Print the current time from the direct, cached and system clock reads.";

/// Largest accepted --interval / --wait, in ms.
constexpr std::uint64_t MAX_MS = 60'000;

/// Build argument definitions.
args::ArgMap buildArgMap() {
  args::ArgMap map;
  map[ARG_HELP] = {"--help", 0, false, "Show this help message"};
  map[ARG_JSON] = {"--json", 0, false, "Output in JSON format"};
  map[ARG_INTERVAL] = {"--interval", 1, false, "Cache refresh interval in ms (default: 100)"};
  map[ARG_WAIT] = {"--wait", 1, false, "Sleep before reading the cache, in ms (default: 0)"};
  return map;
}

/// Everything read in one run.
struct Readings {
  std::uint32_t compactEpoch{0};
  std::uint32_t cachedEpoch{0};
  std::int64_t cachedUnixNanos{0};
  std::int64_t systemSeconds{0};
  tctime::Duration cacheAge{};
  std::int64_t intervalMs{0};
  std::uint64_t refreshCount{0};
};

/* ----------------------------- Human Output ----------------------------- */

void printHuman(const Readings& r) {
  fmt::print("current time using CompactEpoch::now() is:        {}\n", r.compactEpoch);
  fmt::print("current time using RefreshCache::cachedEpoch() is: {}\n", r.cachedEpoch);
  fmt::print("current time using cachedUnixNanos() is:          {}\n", r.cachedUnixNanos);
  fmt::print("current time using system_clock is:               {}\n", r.systemSeconds);
  fmt::print("\ncache age: {} (interval {} ms, {} refreshes)\n", r.cacheAge, r.intervalMs, r.refreshCount);
}

/* ----------------------------- JSON Output ----------------------------- */

void printJson(const Readings& r) {
  fmt::print("{{\n");
  fmt::print("  \"compactEpoch\": {},\n", r.compactEpoch);
  fmt::print("  \"cachedEpoch\": {},\n", r.cachedEpoch);
  fmt::print("  \"cachedUnixNanos\": {},\n", r.cachedUnixNanos);
  fmt::print("  \"systemClockSeconds\": {},\n", r.systemSeconds);
  fmt::print("  \"cacheAgeNs\": {},\n", r.cacheAge.nanoseconds());
  fmt::print("  \"intervalMs\": {},\n", r.intervalMs);
  fmt::print("  \"refreshCount\": {}\n", r.refreshCount);
  fmt::print("}}\n");
}

} // namespace

/* ----------------------------- Main ----------------------------- */

int main(int argc, char* argv[]) {
  const args::ArgMap ARG_MAP = buildArgMap();
  args::ParsedArgs pargs;
  bool jsonOutput = false;

  cache::CacheConfig config = cache::CacheConfig::standard();
  std::chrono::milliseconds wait{0};

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

    const std::optional<std::uint64_t> INTERVAL = args::unsignedValue(pargs, ARG_INTERVAL, 1, MAX_MS, error);
    const std::optional<std::uint64_t> WAIT = args::unsignedValue(pargs, ARG_WAIT, 0, MAX_MS, error);
    if (!error.empty()) {
      fmt::print(stderr, "Error: {}\n\n", error);
      args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
      return 1;
    }
    if (INTERVAL) {
      config.refreshInterval = std::chrono::milliseconds{static_cast<std::int64_t>(*INTERVAL)};
    }
    if (WAIT) {
      wait = std::chrono::milliseconds{static_cast<std::int64_t>(*WAIT)};
    }
  }

  const cache::RefreshCache CLOCK(config);
  if (wait.count() > 0) {
    std::this_thread::sleep_for(wait);
  }

  Readings r;
  const cache::CachedSample SAMPLE = CLOCK.sample();
  r.compactEpoch = tctime::CompactEpoch::now().value();
  r.cachedEpoch = CLOCK.cachedEpoch().value();
  r.cachedUnixNanos = SAMPLE.unixNanos;
  r.systemSeconds =
      std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch())
          .count();
  r.cacheAge = tctime::Instant::since(SAMPLE.now);
  r.intervalMs = CLOCK.interval().count();
  r.refreshCount = CLOCK.refreshCount();

  if (jsonOutput) {
    printJson(r);
  } else {
    printHuman(r);
  }

  return 0;
}

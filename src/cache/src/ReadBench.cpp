/**
 * @file ReadBench.cpp
 * @brief Implementation of the clock and cache read cost benchmark.
 */

#include "src/cache/inc/ReadBench.hpp"

#include <cstdint>

#include <fmt/core.h>

namespace timecache {

namespace cache {

/* ----------------------------- Internal Helpers ----------------------------- */

namespace {

using Clock = std::chrono::steady_clock;
using std::chrono::duration_cast;
using std::chrono::nanoseconds;

constexpr std::size_t WARMUP_ITERATIONS = 100;

/// Keeps measured results observable so loops are not folded away.
volatile std::uint64_t gSink = 0;

/**
 * Mean nanoseconds per call of read().
 * read() returns a 64-bit digest of its result; digests are folded into gSink.
 */
template <typename Read> double timeReads(std::size_t iterations, Read read) noexcept {
  std::uint64_t acc = 0;

  for (std::size_t i = 0; i < WARMUP_ITERATIONS; ++i) {
    acc ^= read();
  }

  const auto T0 = Clock::now();
  for (std::size_t i = 0; i < iterations; ++i) {
    acc ^= read();
  }
  const auto T1 = Clock::now();

  gSink = gSink ^ acc;

  const nanoseconds TOTAL = duration_cast<nanoseconds>(T1 - T0);
  return static_cast<double>(TOTAL.count()) / static_cast<double>(iterations);
}

} // namespace

/* ----------------------------- ReadCostStats Methods ----------------------------- */

double ReadCostStats::cachedSpeedup() const noexcept {
  if (cachedNowNs <= 0.0) {
    return 0.0;
  }
  return instantNowNs / cachedNowNs;
}

bool ReadCostStats::cacheIsFaster() const noexcept { return cachedNowNs < instantNowNs; }

std::string ReadCostStats::toString() const {
  std::string out;
  out.reserve(768);

  out += "Clock Read Cost:\n";
  out += fmt::format("  Iterations: {} per read\n", iterations);
  out += fmt::format("  Cache refresh interval: {} ms\n", refreshInterval.count());

  out += "\n  Direct Reads:\n";
  out += fmt::format("    Instant::now()        {:>8.1f} ns\n", instantNowNs);
  out += fmt::format("    CompactEpoch::now()   {:>8.1f} ns\n", compactEpochNowNs);
  out += fmt::format("    system_clock::now()   {:>8.1f} ns\n", systemClockNowNs);

  out += "\n  Cached Reads:\n";
  out += fmt::format("    cachedNow()           {:>8.1f} ns\n", cachedNowNs);
  out += fmt::format("    cachedEpoch()         {:>8.1f} ns\n", cachedEpochNs);

  out += "\n  Footprint:\n";
  out += fmt::format("    Instant               {:>8} bytes\n", instantBytes);
  out += fmt::format("    CompactEpoch          {:>8} bytes\n", compactEpochBytes);
  out += fmt::format("    time_point            {:>8} bytes\n", timePointBytes);

  out += fmt::format("\n  Cached speedup: {:.1f}x", cachedSpeedup());
  if (cacheIsFaster()) {
    out += " [CACHE FASTER]\n";
  } else {
    out += " [NO GAIN]\n";
  }

  return out;
}

/* ----------------------------- ReadBenchConfig Methods ----------------------------- */

ReadBenchConfig ReadBenchConfig::quick() noexcept {
  ReadBenchConfig cfg;
  cfg.iterations = 10'000;
  return cfg;
}

ReadBenchConfig ReadBenchConfig::thorough() noexcept {
  ReadBenchConfig cfg;
  cfg.iterations = 1'000'000;
  return cfg;
}

/* ----------------------------- API ----------------------------- */

ReadCostStats measureReadCost(const ReadBenchConfig& config) {
  CacheConfig cacheConfig;
  cacheConfig.refreshInterval = config.refreshInterval;
  const RefreshCache CACHE(cacheConfig);
  return measureReadCost(config, CACHE);
}

ReadCostStats measureReadCost(const ReadBenchConfig& config, const RefreshCache& cache) noexcept {
  ReadCostStats result;

  // Enforce minimum iterations
  std::size_t iterations = config.iterations;
  if (iterations < MIN_BENCH_ITERATIONS) {
    iterations = MIN_BENCH_ITERATIONS;
  }
  result.iterations = iterations;
  result.refreshInterval = cache.interval();

  result.instantNowNs = timeReads(iterations, [] {
    return static_cast<std::uint64_t>(time::Instant::now().unixNanos());
  });
  result.compactEpochNowNs = timeReads(iterations, [] {
    return static_cast<std::uint64_t>(time::CompactEpoch::now().value());
  });
  result.systemClockNowNs = timeReads(iterations, [] {
    return static_cast<std::uint64_t>(std::chrono::system_clock::now().time_since_epoch().count());
  });
  result.cachedNowNs = timeReads(iterations, [&cache] {
    return static_cast<std::uint64_t>(cache.cachedNow().unixNanos());
  });
  result.cachedEpochNs = timeReads(iterations, [&cache] {
    return static_cast<std::uint64_t>(cache.cachedEpoch().value());
  });

  result.instantBytes = sizeof(time::Instant);
  result.compactEpochBytes = sizeof(time::CompactEpoch);
  result.timePointBytes = sizeof(std::chrono::system_clock::time_point);

  return result;
}

} // namespace cache

} // namespace timecache

#ifndef TIMECACHE_CACHE_READ_BENCH_HPP
#define TIMECACHE_CACHE_READ_BENCH_HPP
/**
 * @file ReadBench.hpp
 * @brief Per-call cost of the clock reads and the cached reads.
 * @note Thread-safe: All functions are stateless and safe to call concurrently.
 *
 * Compares, per call:
 *  - Instant::now() and CompactEpoch::now() (direct clock reads)
 *  - std::chrono::system_clock::now() (baseline)
 *  - RefreshCache::cachedNow() and RefreshCache::cachedEpoch() (cached reads)
 *
 * and reports the footprint of each timestamp representation. Use it to
 * decide whether a hot path benefits from the cache on a given platform.
 */

#include <chrono>  // std::chrono::milliseconds
#include <cstddef> // std::size_t
#include <string>  // std::string

#include "src/cache/inc/RefreshCache.hpp"

namespace timecache {

namespace cache {

/* ----------------------------- Constants ----------------------------- */

/// Minimum iterations per measured read (enforced floor).
inline constexpr std::size_t MIN_BENCH_ITERATIONS = 1000;

/* ----------------------------- ReadCostStats ----------------------------- */

/**
 * @brief Mean cost per call of each read, in nanoseconds.
 */
struct ReadCostStats {
  std::size_t iterations{0}; ///< Calls timed per read

  double instantNowNs{0.0};      ///< Instant::now()
  double compactEpochNowNs{0.0}; ///< CompactEpoch::now()
  double systemClockNowNs{0.0};  ///< std::chrono::system_clock::now()
  double cachedNowNs{0.0};       ///< RefreshCache::cachedNow()
  double cachedEpochNs{0.0};     ///< RefreshCache::cachedEpoch()

  std::size_t instantBytes{0};      ///< sizeof(Instant)
  std::size_t compactEpochBytes{0}; ///< sizeof(CompactEpoch)
  std::size_t timePointBytes{0};    ///< sizeof(system_clock::time_point)

  std::chrono::milliseconds refreshInterval{0}; ///< Cadence of the cache measured

  /// @brief instantNowNs / cachedNowNs, 0 if the cached read measured as free.
  [[nodiscard]] double cachedSpeedup() const noexcept;

  /// @brief True if cachedNow() was cheaper than Instant::now().
  [[nodiscard]] bool cacheIsFaster() const noexcept;

  /// @brief Human-readable table.
  /// @note NOT RT-safe: Allocates for string building.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- ReadBenchConfig ----------------------------- */

/**
 * @brief Configuration for the read cost benchmark.
 */
struct ReadBenchConfig {
  std::size_t iterations{100'000};                                  ///< Calls per measured read
  std::chrono::milliseconds refreshInterval{DEFAULT_REFRESH_INTERVAL}; ///< Cadence of the bench's own cache

  /// @brief Create config for quick measurement.
  [[nodiscard]] static ReadBenchConfig quick() noexcept;

  /// @brief Create config for thorough measurement.
  [[nodiscard]] static ReadBenchConfig thorough() noexcept;
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Measure read costs against a cache built for the run.
 * @param config Benchmark configuration.
 * @return Per-call costs and footprints.
 * @throws std::system_error if the cache's refresh thread cannot be started.
 * @note NOT RT-safe: Starts a thread, active benchmark.
 */
[[nodiscard]] ReadCostStats measureReadCost(const ReadBenchConfig& config);

/**
 * @brief Measure read costs against an existing cache.
 * @param config Benchmark configuration; refreshInterval is ignored.
 * @param cache Cache whose reads are timed.
 * @return Per-call costs and footprints.
 * @note RT-safe after warmup: No allocation in measurement loops.
 */
[[nodiscard]] ReadCostStats measureReadCost(const ReadBenchConfig& config, const RefreshCache& cache) noexcept;

} // namespace cache

} // namespace timecache

#endif // TIMECACHE_CACHE_READ_BENCH_HPP

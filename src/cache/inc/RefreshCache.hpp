#ifndef TIMECACHE_CACHE_REFRESH_CACHE_HPP
#define TIMECACHE_CACHE_REFRESH_CACHE_HPP
/**
 * @file RefreshCache.hpp
 * @brief Periodically refreshed "current time" for hot read paths.
 * @note Thread-safe: Reads from any thread. One background writer per cache.
 *
 * Reading the clock costs a vDSO call per read. Code that only needs
 * "roughly now" (expiry checks, log stamps, rate windows) can instead read a
 * sample that a background thread refreshes on a fixed cadence:
 *  - The constructor samples the clock before returning, so reads are never
 *    older than construction.
 *  - Reads never touch the clock and never block.
 *  - A read may lag the true time by up to one refresh interval plus
 *    scheduling delay of the refresh thread.
 *
 * Usage:
 * @code
 *   timecache::cache::RefreshCache clock(timecache::cache::CacheConfig::fast());
 *   const auto STAMP = clock.cachedEpoch();   // 4-byte seconds
 *   const auto NOW = clock.cachedNow();       // full Instant
 * @endcode
 */

#include <atomic>             // std::atomic
#include <chrono>             // std::chrono::milliseconds
#include <condition_variable> // std::condition_variable
#include <cstdint>            // std::int64_t, std::uint32_t, std::uint64_t
#include <mutex>              // std::mutex
#include <string>             // std::string
#include <thread>             // std::thread

#include "src/cache/inc/SeqCell.hpp"
#include "src/time/inc/CompactEpoch.hpp"
#include "src/time/inc/Instant.hpp"

namespace timecache {

namespace cache {

/* ----------------------------- Constants ----------------------------- */

/// Default refresh cadence.
inline constexpr std::chrono::milliseconds DEFAULT_REFRESH_INTERVAL{100};

/// Shortest accepted refresh cadence; shorter requests are raised to this.
inline constexpr std::chrono::milliseconds MIN_REFRESH_INTERVAL{1};

/* ----------------------------- CacheConfig ----------------------------- */

/**
 * @brief Configuration for a RefreshCache.
 */
struct CacheConfig {
  std::chrono::milliseconds refreshInterval{DEFAULT_REFRESH_INTERVAL};

  /// @brief 10 ms cadence: tight staleness for rate limiting.
  [[nodiscard]] static CacheConfig fast() noexcept;

  /// @brief 100 ms cadence.
  [[nodiscard]] static CacheConfig standard() noexcept;

  /// @brief 1 s cadence: enough for second-granularity expiry stamps.
  [[nodiscard]] static CacheConfig coarse() noexcept;
};

/* ----------------------------- CachedSample ----------------------------- */

/**
 * @brief One clock sample, published as a unit.
 *
 * All three fields come from the same clock read.
 */
struct CachedSample {
  time::Instant now{};        ///< Full instant, monotonic reading included
  std::int64_t unixSeconds{0}; ///< now.unixSeconds()
  std::int64_t unixNanos{0};   ///< now.unixNanos()

  /// @brief Sample derived from a single Instant.
  [[nodiscard]] static CachedSample fromInstant(const time::Instant& t) noexcept;

  /// @brief Human-readable one-liner.
  /// @note NOT RT-safe: Allocates for string building.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- RefreshCache ----------------------------- */

/**
 * @brief Clock sample refreshed by one background thread.
 *
 * The refresh thread lives exactly as long as the object. The destructor
 * stops and joins it; a stop request is only seen between wakeups, never
 * mid-publish.
 */
class RefreshCache {
public:
  /**
   * @brief Publish a first sample, then start the refresh thread.
   * @param config Cadence; intervals below MIN_REFRESH_INTERVAL are raised.
   * @throws std::system_error if the thread cannot be started.
   * @note NOT RT-safe: Spawns a thread.
   */
  explicit RefreshCache(const CacheConfig& config = CacheConfig{});

  /// @brief Stop and join the refresh thread.
  ~RefreshCache();

  RefreshCache(const RefreshCache&) = delete;
  RefreshCache& operator=(const RefreshCache&) = delete;
  RefreshCache(RefreshCache&&) = delete;
  RefreshCache& operator=(RefreshCache&&) = delete;

  /* ---------- Reads ---------- */

  /// @brief Last published Instant.
  /// @note RT-SAFE: Lock-free seqlock read.
  [[nodiscard]] time::Instant cachedNow() const noexcept { return sample_.load().now; }

  /// @brief Last published Unix seconds.
  [[nodiscard]] std::int64_t cachedUnixSeconds() const noexcept { return sample_.load().unixSeconds; }

  /// @brief Last published Unix nanoseconds.
  [[nodiscard]] std::int64_t cachedUnixNanos() const noexcept { return sample_.load().unixNanos; }

  /// @brief Last published seconds as a CompactEpoch.
  /// @note RT-SAFE: One relaxed atomic load.
  [[nodiscard]] time::CompactEpoch cachedEpoch() const noexcept {
    return time::CompactEpoch{epoch_.load(std::memory_order_relaxed)};
  }

  /// @brief Last published sample, all fields from one publication.
  [[nodiscard]] CachedSample sample() const noexcept { return sample_.load(); }

  /* ---------- Control ---------- */

  /**
   * @brief Sample the clock and publish now, from the calling thread.
   *
   * Serialized against the refresh thread; readers are not blocked.
   */
  void refresh() noexcept;

  /// @brief Publications so far, the constructor's included.
  [[nodiscard]] std::uint64_t refreshCount() const noexcept {
    return refreshes_.load(std::memory_order_relaxed);
  }

  /// @brief Effective refresh cadence.
  [[nodiscard]] std::chrono::milliseconds interval() const noexcept { return interval_; }

private:
  void run() noexcept;

  SeqCell<CachedSample> sample_;
  std::atomic<std::uint32_t> epoch_{0};
  std::atomic<std::uint64_t> refreshes_{0};
  std::chrono::milliseconds interval_;

  std::mutex writeMutex_; // Serializes publishers only

  std::mutex stopMutex_;
  std::condition_variable stopCv_;
  bool stopRequested_{false};

  std::thread worker_;
};

} // namespace cache

} // namespace timecache

#endif // TIMECACHE_CACHE_REFRESH_CACHE_HPP

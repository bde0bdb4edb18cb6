/**
 * @file RefreshCache.cpp
 * @brief Implementation of the background-refreshed clock sample.
 */

#include "src/cache/inc/RefreshCache.hpp"

#include <fmt/core.h>

namespace timecache {

namespace cache {

using Clock = std::chrono::steady_clock;

/* ----------------------------- CacheConfig Methods ----------------------------- */

CacheConfig CacheConfig::fast() noexcept {
  CacheConfig cfg;
  cfg.refreshInterval = std::chrono::milliseconds{10};
  return cfg;
}

CacheConfig CacheConfig::standard() noexcept {
  CacheConfig cfg;
  cfg.refreshInterval = DEFAULT_REFRESH_INTERVAL;
  return cfg;
}

CacheConfig CacheConfig::coarse() noexcept {
  CacheConfig cfg;
  cfg.refreshInterval = std::chrono::milliseconds{1000};
  return cfg;
}

/* ----------------------------- CachedSample Methods ----------------------------- */

CachedSample CachedSample::fromInstant(const time::Instant& t) noexcept {
  CachedSample s;
  s.now = t;
  s.unixSeconds = t.unixSeconds();
  s.unixNanos = t.unixNanos();
  return s;
}

std::string CachedSample::toString() const {
  return fmt::format("unix={}s unixNanos={}ns monotonic={}ns", unixSeconds, unixNanos, now.monotonic());
}

/* ----------------------------- RefreshCache ----------------------------- */

RefreshCache::RefreshCache(const CacheConfig& config)
    : interval_{config.refreshInterval < MIN_REFRESH_INTERVAL ? MIN_REFRESH_INTERVAL
                                                              : config.refreshInterval} {
  refresh();
  worker_ = std::thread(&RefreshCache::run, this);
}

RefreshCache::~RefreshCache() {
  {
    std::lock_guard<std::mutex> lock(stopMutex_);
    stopRequested_ = true;
  }
  stopCv_.notify_all();

  if (worker_.joinable()) {
    worker_.join();
  }
}

void RefreshCache::refresh() noexcept {
  // Sample under the lock so publications stay in clock order.
  std::lock_guard<std::mutex> lock(writeMutex_);
  const CachedSample SAMPLE = CachedSample::fromInstant(time::Instant::now());
  sample_.store(SAMPLE);
  epoch_.store(static_cast<std::uint32_t>(SAMPLE.unixSeconds), std::memory_order_relaxed);
  refreshes_.fetch_add(1, std::memory_order_relaxed);
}

void RefreshCache::run() noexcept {
  auto next = Clock::now() + interval_;

  std::unique_lock<std::mutex> lock(stopMutex_);
  while (!stopCv_.wait_until(lock, next, [this] { return stopRequested_; })) {
    lock.unlock();
    refresh();
    lock.lock();

    // Fixed cadence; ticks missed while descheduled are dropped, not replayed.
    next += interval_;
    const auto NOW = Clock::now();
    if (next <= NOW) {
      next = NOW + interval_;
    }
  }
}

} // namespace cache

} // namespace timecache

#ifndef TIMECACHE_TIME_COMPACT_EPOCH_HPP
#define TIMECACHE_TIME_COMPACT_EPOCH_HPP
/**
 * @file CompactEpoch.hpp
 * @brief 32-bit Unix seconds for footprint-sensitive timestamps.
 * @note Thread-safe: Plain value type. now() is a pure function of the clock.
 *
 * Half the size of a 64-bit Unix second and a quarter of an Instant. Use it
 * where sub-second precision is not needed and dates stay before 2106
 * (for example expiry stamps stored per entry in large tables).
 */

#include <cstdint> // std::uint32_t

#include "src/time/inc/Instant.hpp"

namespace timecache {

namespace time {

/* ----------------------------- Constants ----------------------------- */

/// Seconds in a civil day (no leap seconds).
inline constexpr std::int64_t SECONDS_PER_DAY = 86'400;

/* ----------------------------- CompactEpoch ----------------------------- */

/**
 * @brief Unsigned 32-bit count of seconds since 1970-01-01 00:00:00 UTC.
 *
 * Arithmetic is modulo 2^32, like the underlying integer.
 */
class CompactEpoch {
public:
  constexpr CompactEpoch() noexcept = default;
  constexpr explicit CompactEpoch(std::uint32_t sec) noexcept : sec_{sec} {}

  /**
   * @brief Read the wall clock.
   * @note RT-SAFE: One vDSO clock read, no allocation.
   */
  [[nodiscard]] static CompactEpoch now() noexcept;

  /// @brief Whole Unix seconds of t, truncated to 32 bits.
  [[nodiscard]] static CompactEpoch fromInstant(const Instant& t) noexcept;

  /// @brief Wall-only Instant at the same second.
  [[nodiscard]] Instant toInstant() const noexcept;

  /// @brief Raw seconds since the Unix epoch.
  [[nodiscard]] constexpr std::uint32_t value() const noexcept { return sec_; }

  /**
   * @brief Shift by whole days (negative moves back).
   * @param days Number of 86400-second days.
   */
  [[nodiscard]] constexpr CompactEpoch addDays(int days) const noexcept {
    const std::int64_t V = static_cast<std::int64_t>(sec_) + static_cast<std::int64_t>(days) * SECONDS_PER_DAY;
    return CompactEpoch{static_cast<std::uint32_t>(V)};
  }

  friend constexpr bool operator==(CompactEpoch a, CompactEpoch b) noexcept { return a.sec_ == b.sec_; }
  friend constexpr bool operator!=(CompactEpoch a, CompactEpoch b) noexcept { return a.sec_ != b.sec_; }
  friend constexpr bool operator<(CompactEpoch a, CompactEpoch b) noexcept { return a.sec_ < b.sec_; }
  friend constexpr bool operator<=(CompactEpoch a, CompactEpoch b) noexcept { return a.sec_ <= b.sec_; }
  friend constexpr bool operator>(CompactEpoch a, CompactEpoch b) noexcept { return a.sec_ > b.sec_; }
  friend constexpr bool operator>=(CompactEpoch a, CompactEpoch b) noexcept { return a.sec_ >= b.sec_; }

private:
  std::uint32_t sec_{0};
};

static_assert(sizeof(CompactEpoch) == 4, "CompactEpoch must stay 32 bits");

} // namespace time

} // namespace timecache

#endif // TIMECACHE_TIME_COMPACT_EPOCH_HPP

#ifndef TIMECACHE_TIME_INSTANT_HPP
#define TIMECACHE_TIME_INSTANT_HPP
/**
 * @file Instant.hpp
 * @brief Pointer-free point in time with an optional monotonic reading.
 * @note Thread-safe: Plain value type. now() is a pure function of the clock.
 *
 * The host offers a wall clock, which can be stepped by time sync, and a
 * monotonic clock, which cannot. An Instant returned by now() carries both:
 * telling time uses the wall reading, measuring time uses the monotonic one.
 *
 *  - If both operands of sub(), before(), after() or equal() carry a
 *    monotonic reading, only the monotonic readings are used.
 *  - Otherwise the wall readings are used.
 *  - add() advances both readings. truncate(), round() and stripMonotonic()
 *    drop the monotonic reading.
 *  - fromUnix() never produces a monotonic reading; it has no meaning outside
 *    the process that took it.
 *
 * Layout: two 64-bit words, no pointers. From high to low bit, wall_ holds a
 * hasMonotonic flag, a 33-bit seconds field and a 30-bit nanoseconds field.
 * With the flag clear the 33-bit field is zero and ext_ holds signed seconds
 * since January 1, year 1. With the flag set the 33-bit field holds unsigned
 * seconds since January 1, 1885 (good through 2157) and ext_ holds the
 * monotonic reading in nanoseconds since a process-local reference point.
 * Wall times outside that window cannot keep a monotonic reading and
 * silently fall back to the wall-only form.
 */

#include <cstdint> // std::int64_t, std::uint64_t

#include "src/time/inc/Duration.hpp"

namespace timecache {

namespace time {

/* ----------------------------- Constants ----------------------------- */

/// Seconds from January 1, year 1 to the Unix epoch (1970-01-01).
inline constexpr std::int64_t UNIX_TO_INTERNAL = (1969LL * 365 + 1969 / 4 - 1969 / 100 + 1969 / 400) * 86'400;

/// Seconds from January 1, year 1 to January 1, 1885 (packed-seconds origin).
inline constexpr std::int64_t WALL_TO_INTERNAL = (1884LL * 365 + 1884 / 4 - 1884 / 100 + 1884 / 400) * 86'400;

/// Earliest internal second that can carry a monotonic reading.
inline constexpr std::int64_t MIN_MONOTONIC_WALL = WALL_TO_INTERNAL;

/// Latest internal second that can carry a monotonic reading (year 2157).
inline constexpr std::int64_t MAX_MONOTONIC_WALL = WALL_TO_INTERNAL + ((1LL << 33) - 1);

struct CheckedAdd;

/* ----------------------------- Instant ----------------------------- */

/**
 * @brief Point in time with nanosecond precision.
 *
 * The zero value is January 1, year 1, 00:00:00 UTC; isZero() detects it.
 * Pass and store by value. Prefer equal() over comparing fields: two
 * Instants for the same moment may differ in whether they hold a monotonic
 * reading.
 */
class Instant {
public:
  constexpr Instant() noexcept = default;

  /**
   * @brief Read the clock.
   * @return Current wall time plus a monotonic reading.
   * @note RT-SAFE: Two vDSO clock reads, no allocation.
   */
  [[nodiscard]] static Instant now() noexcept;

  /**
   * @brief Build an Instant from Unix seconds and nanoseconds.
   *
   * nsec may lie outside [0, 999999999]; it is carried into (or borrowed
   * from) sec. fromUnix(10, -1) equals fromUnix(9, 999999999).
   *
   * @return Wall-only Instant (no monotonic reading).
   */
  [[nodiscard]] static Instant fromUnix(std::int64_t sec, std::int64_t nsec) noexcept;

  /**
   * @brief Time elapsed since t.
   *
   * When t carries a monotonic reading only the monotonic clock is read.
   * Shorthand for now().sub(t).
   */
  [[nodiscard]] static Duration since(const Instant& t) noexcept;

  /// @brief Time remaining until t. Shorthand for t.sub(now()).
  [[nodiscard]] static Duration until(const Instant& t) noexcept;

  /* ---------- Arithmetic ---------- */

  /**
   * @brief This instant shifted by d.
   *
   * Advances the monotonic reading too. If that reading would overflow, or
   * the wall seconds leave the packed window, the result is wall-only.
   * Wall seconds saturate at the int64 range.
   */
  [[nodiscard]] Instant add(Duration d) const noexcept;

  /**
   * @brief Same as add(), also reporting a dropped monotonic reading.
   *
   * For callers that must audit the silent fallback to wall-only arithmetic.
   */
  [[nodiscard]] CheckedAdd addChecked(Duration d) const noexcept;

  /**
   * @brief Elapsed time this - u.
   * @return Difference, saturated at Duration::min()/max(). When the result
   *         is not saturated, u.add(result).equal(*this) holds.
   */
  [[nodiscard]] Duration sub(const Instant& u) const noexcept;

  /* ---------- Comparison ---------- */

  [[nodiscard]] bool before(const Instant& u) const noexcept;
  [[nodiscard]] bool after(const Instant& u) const noexcept;
  [[nodiscard]] bool equal(const Instant& u) const noexcept;

  /* ---------- Rounding ---------- */

  /**
   * @brief Round down to a multiple of d since the zero Instant.
   *
   * Works on the absolute offset from the zero Instant, not on any calendar
   * presentation. The monotonic reading is always dropped. If d <= 0 the
   * instant is otherwise unchanged.
   */
  [[nodiscard]] Instant truncate(Duration d) const noexcept;

  /**
   * @brief Round to the nearest multiple of d since the zero Instant.
   *
   * Halfway values round up. Same reference point and monotonic handling as
   * truncate().
   */
  [[nodiscard]] Instant round(Duration d) const noexcept;

  /// @brief Copy without the monotonic reading (same as round(Duration{0})).
  [[nodiscard]] Instant stripMonotonic() const noexcept;

  /* ---------- Accessors ---------- */

  /// @brief Seconds since the Unix epoch.
  [[nodiscard]] std::int64_t unixSeconds() const noexcept;

  /**
   * @brief Nanoseconds since the Unix epoch.
   * @note Only meaningful between years 1678 and 2262; wraps outside.
   */
  [[nodiscard]] std::int64_t unixNanos() const noexcept;

  /// @brief Nanosecond offset within the second, [0, 999999999].
  [[nodiscard]] std::int32_t nanosecond() const noexcept { return nsec(); }

  /// @brief True for January 1, year 1, 00:00:00 UTC.
  [[nodiscard]] bool isZero() const noexcept { return sec() == 0 && nsec() == 0; }

  /// @brief True if a monotonic reading is attached.
  [[nodiscard]] bool hasMonotonic() const noexcept { return (wall_ & HAS_MONOTONIC) != 0; }

  /// @brief Monotonic reading in ns since the process reference, 0 if absent.
  [[nodiscard]] std::int64_t monotonic() const noexcept { return hasMonotonic() ? ext_ : 0; }

private:
  static constexpr std::uint64_t HAS_MONOTONIC = 1ULL << 63;
  static constexpr std::uint64_t NSEC_MASK = (1ULL << 30) - 1;
  static constexpr unsigned NSEC_SHIFT = 30;

  constexpr Instant(std::uint64_t wall, std::int64_t ext) noexcept : wall_{wall}, ext_{ext} {}

  [[nodiscard]] std::int32_t nsec() const noexcept { return static_cast<std::int32_t>(wall_ & NSEC_MASK); }

  /// Seconds since January 1, year 1.
  [[nodiscard]] std::int64_t sec() const noexcept;

  // Mutating helpers; only ever applied to local copies.
  void addSec(std::int64_t d) noexcept;
  void stripMono() noexcept;

  std::uint64_t wall_{0};
  std::int64_t ext_{0};
};

/* ----------------------------- CheckedAdd ----------------------------- */

/**
 * @brief Result of Instant::addChecked().
 */
struct CheckedAdd {
  Instant value{};              ///< Same result add() returns
  bool monotonicDropped{false}; ///< True if the input had a monotonic reading and the result lost it
};

static_assert(sizeof(Instant) == 16, "Instant must stay two machine words");

} // namespace time

} // namespace timecache

#endif // TIMECACHE_TIME_INSTANT_HPP

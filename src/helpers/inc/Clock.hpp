#ifndef TIMECACHE_HELPERS_CLOCK_HPP
#define TIMECACHE_HELPERS_CLOCK_HPP
/**
 * @file Clock.hpp
 * @brief Host clock readings (wall clock and monotonic counter).
 *
 * The only place the library touches the operating system clock. Everything
 * above this header works on the values returned here.
 *
 * @note RT-CAUTION: Syscall (clock_gettime), but typically vDSO-accelerated.
 */

#include <cstdint>
#include <cstdlib> // std::abort
#include <ctime>   // clock_gettime, CLOCK_REALTIME, CLOCK_MONOTONIC

#include <fmt/core.h>

namespace timecache {
namespace helpers {
namespace clock {

/* ----------------------------- Types ----------------------------- */

/**
 * @brief Wall-clock reading relative to the Unix epoch.
 */
struct WallReading {
  std::int64_t sec{0};  ///< Seconds since 1970-01-01 00:00:00 UTC
  std::int32_t nsec{0}; ///< Nanoseconds within the second [0, 999999999]
};

/* ----------------------------- Failure ----------------------------- */

/**
 * @brief Report an unusable host clock and terminate.
 * @param what Name of the clock that failed.
 *
 * Correct time is assumed available; a failing clock read is not recoverable.
 */
[[noreturn]] inline void clockFailure(const char* what) noexcept {
  fmt::print(stderr, "timecache: clock_gettime({}) failed, aborting\n", what);
  std::abort();
}

/* ----------------------------- API ----------------------------- */

/**
 * @brief Read CLOCK_REALTIME.
 * @return Current wall-clock time since the Unix epoch.
 * @note RT-CAUTION: Syscall (clock_gettime), but typically vDSO-accelerated.
 */
[[nodiscard]] inline WallReading readWallClock() noexcept {
  struct timespec ts{};
  if (::clock_gettime(CLOCK_REALTIME, &ts) != 0) {
    clockFailure("CLOCK_REALTIME");
  }
  return WallReading{static_cast<std::int64_t>(ts.tv_sec), static_cast<std::int32_t>(ts.tv_nsec)};
}

/**
 * @brief Read CLOCK_MONOTONIC in nanoseconds.
 *
 * Non-decreasing and unaffected by wall-clock adjustments. The zero point is
 * arbitrary (boot on Linux), so values only compare within one host.
 *
 * @return Current monotonic time in nanoseconds.
 * @note RT-CAUTION: Syscall (clock_gettime), but typically vDSO-accelerated.
 */
[[nodiscard]] inline std::int64_t readMonotonicNs() noexcept {
  struct timespec ts{};
  if (::clock_gettime(CLOCK_MONOTONIC, &ts) != 0) {
    clockFailure("CLOCK_MONOTONIC");
  }
  return static_cast<std::int64_t>(ts.tv_sec) * 1'000'000'000LL +
         static_cast<std::int64_t>(ts.tv_nsec);
}

} // namespace clock
} // namespace helpers
} // namespace timecache

#endif // TIMECACHE_HELPERS_CLOCK_HPP

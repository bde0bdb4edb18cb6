#ifndef TIMECACHE_TIME_DURATION_HPP
#define TIMECACHE_TIME_DURATION_HPP
/**
 * @file Duration.hpp
 * @brief Signed nanosecond duration with saturating arithmetic.
 * @note Thread-safe: Plain value type, no shared state.
 *
 * Duration is a single int64 nanosecond count, which limits the range to
 * roughly +/-292 years. Arithmetic never wraps: results that do not fit
 * saturate at Duration::min() or Duration::max().
 *
 * There are no units of a day or larger; day length is a calendar concern.
 */

#include <array>   // std::array
#include <chrono>  // std::chrono::nanoseconds
#include <cstddef> // std::size_t
#include <cstdint> // std::int64_t
#include <limits>  // std::numeric_limits
#include <span>    // std::span
#include <string>  // std::string

#include <fmt/format.h>

namespace timecache {

namespace time {

/* ----------------------------- Constants ----------------------------- */

/// Buffer size that always holds a rendered duration ("-2562047h47m16.854775808s").
inline constexpr std::size_t DURATION_STRING_MAX = 32;

/* ----------------------------- Duration ----------------------------- */

/**
 * @brief Elapsed time between two instants as a signed nanosecond count.
 *
 * To count units in a Duration, divide (d / MILLISECOND). To build one from
 * an integer count, multiply (MILLISECOND * 250).
 */
class Duration {
public:
  constexpr Duration() noexcept = default;
  constexpr explicit Duration(std::int64_t ns) noexcept : ns_{ns} {}

  /// @brief Smallest representable duration.
  [[nodiscard]] static constexpr Duration min() noexcept {
    return Duration{std::numeric_limits<std::int64_t>::min()};
  }

  /// @brief Largest representable duration.
  [[nodiscard]] static constexpr Duration max() noexcept {
    return Duration{std::numeric_limits<std::int64_t>::max()};
  }

  /// @brief Convert from std::chrono nanoseconds.
  [[nodiscard]] static constexpr Duration fromChrono(std::chrono::nanoseconds ns) noexcept {
    return Duration{static_cast<std::int64_t>(ns.count())};
  }

  /// @brief Convert to std::chrono nanoseconds.
  [[nodiscard]] constexpr std::chrono::nanoseconds toChrono() const noexcept {
    return std::chrono::nanoseconds{ns_};
  }

  /* ---------- Integer accessors (truncate toward zero) ---------- */

  [[nodiscard]] constexpr std::int64_t nanoseconds() const noexcept { return ns_; }
  [[nodiscard]] constexpr std::int64_t microseconds() const noexcept { return ns_ / 1'000; }
  [[nodiscard]] constexpr std::int64_t milliseconds() const noexcept { return ns_ / 1'000'000; }

  /* ---------- Floating accessors ---------- */

  /// @brief Duration as fractional seconds.
  [[nodiscard]] double seconds() const noexcept;

  /// @brief Duration as fractional minutes.
  [[nodiscard]] double minutes() const noexcept;

  /// @brief Duration as fractional hours.
  [[nodiscard]] double hours() const noexcept;

  /* ---------- Rounding ---------- */

  /**
   * @brief Round toward zero to a multiple of m.
   * @param m Granularity. If m <= 0 the duration is returned unchanged.
   */
  [[nodiscard]] Duration truncate(Duration m) const noexcept;

  /**
   * @brief Round to the nearest multiple of m, halfway values away from zero.
   * @param m Granularity. If m <= 0 the duration is returned unchanged.
   * @return Rounded value, saturated at min()/max() when it does not fit.
   */
  [[nodiscard]] Duration round(Duration m) const noexcept;

  /* ---------- Rendering ---------- */

  /**
   * @brief Render into a caller buffer without allocating.
   *
   * Format is "72h3m0.5s". Leading zero units are omitted. Durations under
   * one second use ms, "µs" or ns so that the leading digit is non-zero.
   * Zero renders as "0s".
   *
   * @param out Destination; truncated if smaller than DURATION_STRING_MAX.
   * @return Number of characters written (no terminator).
   * @note RT-SAFE: No allocation.
   */
  std::size_t format(std::span<char> out) const noexcept;

  /// @brief Rendered duration, see format().
  /// @note NOT RT-safe: Allocates.
  [[nodiscard]] std::string toString() const;

  /* ---------- Arithmetic (saturating) ---------- */

  [[nodiscard]] friend constexpr Duration operator+(Duration a, Duration b) noexcept {
    std::int64_t r = 0;
    if (__builtin_add_overflow(a.ns_, b.ns_, &r)) {
      return b.ns_ > 0 ? max() : min();
    }
    return Duration{r};
  }

  [[nodiscard]] friend constexpr Duration operator-(Duration a, Duration b) noexcept {
    std::int64_t r = 0;
    if (__builtin_sub_overflow(a.ns_, b.ns_, &r)) {
      return b.ns_ < 0 ? max() : min();
    }
    return Duration{r};
  }

  [[nodiscard]] friend constexpr Duration operator-(Duration a) noexcept {
    return a.ns_ == std::numeric_limits<std::int64_t>::min() ? max() : Duration{-a.ns_};
  }

  [[nodiscard]] friend constexpr Duration operator*(Duration a, std::int64_t k) noexcept {
    std::int64_t r = 0;
    if (__builtin_mul_overflow(a.ns_, k, &r)) {
      return ((a.ns_ < 0) != (k < 0)) ? min() : max();
    }
    return Duration{r};
  }

  [[nodiscard]] friend constexpr Duration operator*(std::int64_t k, Duration a) noexcept {
    return a * k;
  }

  /// Number of whole m in d (integer division).
  [[nodiscard]] friend constexpr std::int64_t operator/(Duration d, Duration m) noexcept {
    if (m.ns_ == -1 && d.ns_ == std::numeric_limits<std::int64_t>::min()) {
      return std::numeric_limits<std::int64_t>::max();
    }
    return d.ns_ / m.ns_;
  }

  [[nodiscard]] friend constexpr Duration operator%(Duration d, Duration m) noexcept {
    if (m.ns_ == -1) {
      return Duration{};
    }
    return Duration{d.ns_ % m.ns_};
  }

  Duration& operator+=(Duration other) noexcept { return *this = *this + other; }
  Duration& operator-=(Duration other) noexcept { return *this = *this - other; }

  /* ---------- Comparison ---------- */

  friend constexpr bool operator==(Duration a, Duration b) noexcept { return a.ns_ == b.ns_; }
  friend constexpr bool operator!=(Duration a, Duration b) noexcept { return a.ns_ != b.ns_; }
  friend constexpr bool operator<(Duration a, Duration b) noexcept { return a.ns_ < b.ns_; }
  friend constexpr bool operator<=(Duration a, Duration b) noexcept { return a.ns_ <= b.ns_; }
  friend constexpr bool operator>(Duration a, Duration b) noexcept { return a.ns_ > b.ns_; }
  friend constexpr bool operator>=(Duration a, Duration b) noexcept { return a.ns_ >= b.ns_; }

private:
  std::int64_t ns_{0};
};

/* ----------------------------- Units ----------------------------- */

inline constexpr Duration NANOSECOND{1};
inline constexpr Duration MICROSECOND{1'000};
inline constexpr Duration MILLISECOND{1'000'000};
inline constexpr Duration SECOND{1'000'000'000};
inline constexpr Duration MINUTE{60LL * 1'000'000'000};
inline constexpr Duration HOUR{3'600LL * 1'000'000'000};

} // namespace time

} // namespace timecache

/* ----------------------------- fmt support ----------------------------- */

/// Lets fmt::format("{}", d) render a Duration the same way as toString().
template <> struct fmt::formatter<timecache::time::Duration> : fmt::formatter<fmt::string_view> {
  template <typename FormatContext>
  auto format(const timecache::time::Duration& d, FormatContext& ctx) const {
    std::array<char, timecache::time::DURATION_STRING_MAX> buf{};
    const std::size_t LEN = d.format(buf);
    return fmt::formatter<fmt::string_view>::format(fmt::string_view(buf.data(), LEN), ctx);
  }
};

#endif // TIMECACHE_TIME_DURATION_HPP

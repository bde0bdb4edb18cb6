/**
 * @file Instant.cpp
 * @brief Implementation of Instant clock capture, arithmetic and rounding.
 */

#include "src/time/inc/Instant.hpp"
#include "src/helpers/inc/Clock.hpp"

#include <limits>

namespace timecache {

namespace time {

/* ----------------------------- Internal Helpers ----------------------------- */

namespace {

constexpr std::int64_t NS_PER_SEC = 1'000'000'000LL;
constexpr std::int64_t INTERNAL_TO_UNIX = -UNIX_TO_INTERNAL;
constexpr std::int64_t UNIX_TO_PACKED = UNIX_TO_INTERNAL - MIN_MONOTONIC_WALL;

constexpr std::int64_t I64_MIN = std::numeric_limits<std::int64_t>::min();
constexpr std::int64_t I64_MAX = std::numeric_limits<std::int64_t>::max();

/// a + b clamped to the int64 range.
std::int64_t saturatingAdd(std::int64_t a, std::int64_t b) noexcept {
  std::int64_t r = 0;
  if (__builtin_add_overflow(a, b, &r)) {
    return b > 0 ? I64_MAX : I64_MIN;
  }
  return r;
}

/// a - b as a Duration, saturated.
Duration saturatingDiff(std::int64_t a, std::int64_t b) noexcept {
  std::int64_t r = 0;
  if (__builtin_sub_overflow(a, b, &r)) {
    return a > b ? Duration::max() : Duration::min();
  }
  return Duration{r};
}

/**
 * Process-local monotonic reference, fixed on first use.
 *
 * Set one nanosecond before the first reading so that no Instant ever
 * carries a monotonic value of 0 (callers may use 0 as "not set").
 */
std::int64_t monotonicReference() noexcept {
  static const std::int64_t START = helpers::clock::readMonotonicNs() - 1;
  return START;
}

/// Monotonic nanoseconds since the process reference.
std::int64_t monotonicNow() noexcept {
  const std::int64_t REF = monotonicReference();
  return helpers::clock::readMonotonicNs() - REF;
}

/// True if x + x < y, computed without overflow (x and y non-negative).
constexpr bool lessThanHalf(std::int64_t x, std::int64_t y) noexcept {
  return static_cast<std::uint64_t>(x) + static_cast<std::uint64_t>(x) <
         static_cast<std::uint64_t>(y);
}

/**
 * Remainder of (sec, nsec) since the zero Instant divided by d, in [0, d).
 *
 * Computed on the absolute value with 128-bit nanoseconds, then mirrored for
 * negative times so the remainder always points back toward -infinity.
 */
Duration remainder(std::int64_t sec, std::int32_t nsec, Duration d) noexcept {
  bool neg = false;
  std::uint64_t absSec = static_cast<std::uint64_t>(sec);

  if (sec < 0) {
    neg = true;
    absSec = 0 - absSec;
    nsec = -nsec;
    if (nsec < 0) {
      nsec += static_cast<std::int32_t>(NS_PER_SEC);
      --absSec; // absSec >= 1 here
    }
  }

  const unsigned __int128 TOTAL = static_cast<unsigned __int128>(absSec) * NS_PER_SEC +
                                  static_cast<unsigned __int128>(nsec);
  const std::uint64_t DIV = static_cast<std::uint64_t>(d.nanoseconds());
  std::uint64_t r = static_cast<std::uint64_t>(TOTAL % DIV);

  if (neg && r != 0) {
    r = DIV - r;
  }
  return Duration{static_cast<std::int64_t>(r)};
}

} // namespace

/* ----------------------------- Packed Field Helpers ----------------------------- */

std::int64_t Instant::sec() const noexcept {
  if (hasMonotonic()) {
    return WALL_TO_INTERNAL + static_cast<std::int64_t>((wall_ << 1) >> (NSEC_SHIFT + 1));
  }
  return ext_;
}

void Instant::addSec(std::int64_t d) noexcept {
  if (hasMonotonic()) {
    const std::int64_t PACKED = static_cast<std::int64_t>((wall_ << 1) >> (NSEC_SHIFT + 1));
    const std::int64_t DSEC = PACKED + d;
    if (DSEC >= 0 && DSEC <= (1LL << 33) - 1) {
      wall_ = (wall_ & NSEC_MASK) | (static_cast<std::uint64_t>(DSEC) << NSEC_SHIFT) | HAS_MONOTONIC;
      return;
    }
    // Out of the packed window: move seconds to ext_.
    stripMono();
  }
  ext_ = saturatingAdd(ext_, d);
}

void Instant::stripMono() noexcept {
  if (hasMonotonic()) {
    ext_ = sec();
    wall_ &= NSEC_MASK;
  }
}

/* ----------------------------- Construction ----------------------------- */

Instant Instant::now() noexcept {
  const std::int64_t REF = monotonicReference();
  const helpers::clock::WallReading WALL = helpers::clock::readWallClock();
  const std::int64_t MONO = helpers::clock::readMonotonicNs() - REF;

  const std::int64_t PACKED = WALL.sec + UNIX_TO_PACKED;
  const std::uint64_t NSEC = static_cast<std::uint64_t>(WALL.nsec);
  if ((static_cast<std::uint64_t>(PACKED) >> 33) != 0) {
    return Instant{NSEC, PACKED + MIN_MONOTONIC_WALL};
  }
  return Instant{HAS_MONOTONIC | (static_cast<std::uint64_t>(PACKED) << NSEC_SHIFT) | NSEC, MONO};
}

Instant Instant::fromUnix(std::int64_t sec, std::int64_t nsec) noexcept {
  if (nsec < 0 || nsec >= NS_PER_SEC) {
    const std::int64_t CARRY = nsec / NS_PER_SEC;
    sec = saturatingAdd(sec, CARRY);
    nsec -= CARRY * NS_PER_SEC;
    if (nsec < 0) {
      nsec += NS_PER_SEC;
      sec = saturatingAdd(sec, -1);
    }
  }
  return Instant{static_cast<std::uint64_t>(nsec), saturatingAdd(sec, UNIX_TO_INTERNAL)};
}

Duration Instant::since(const Instant& t) noexcept {
  if (t.hasMonotonic()) {
    // Sub would only look at the monotonic readings anyway.
    return saturatingDiff(monotonicNow(), t.ext_);
  }
  return now().sub(t);
}

Duration Instant::until(const Instant& t) noexcept {
  if (t.hasMonotonic()) {
    return saturatingDiff(t.ext_, monotonicNow());
  }
  return t.sub(now());
}

/* ----------------------------- Arithmetic ----------------------------- */

Instant Instant::add(Duration d) const noexcept { return addChecked(d).value; }

CheckedAdd Instant::addChecked(Duration d) const noexcept {
  Instant t = *this;
  const std::int64_t NS = d.nanoseconds();

  std::int64_t dsec = NS / NS_PER_SEC;
  std::int64_t nsec = static_cast<std::int64_t>(t.nsec()) + NS % NS_PER_SEC;
  if (nsec >= NS_PER_SEC) {
    ++dsec;
    nsec -= NS_PER_SEC;
  } else if (nsec < 0) {
    --dsec;
    nsec += NS_PER_SEC;
  }
  t.wall_ = (t.wall_ & ~NSEC_MASK) | static_cast<std::uint64_t>(nsec);
  t.addSec(dsec);

  if (t.hasMonotonic()) {
    std::int64_t mono = 0;
    if (__builtin_add_overflow(t.ext_, NS, &mono)) {
      // Monotonic reading out of range: degrade to wall-only.
      t.stripMono();
    } else {
      t.ext_ = mono;
    }
  }

  return CheckedAdd{t, hasMonotonic() && !t.hasMonotonic()};
}

Duration Instant::sub(const Instant& u) const noexcept {
  if ((wall_ & u.wall_ & HAS_MONOTONIC) != 0) {
    return saturatingDiff(ext_, u.ext_);
  }

  const __int128 DIFF = (static_cast<__int128>(sec()) - static_cast<__int128>(u.sec())) * NS_PER_SEC +
                        (static_cast<__int128>(nsec()) - static_cast<__int128>(u.nsec()));
  if (DIFF > static_cast<__int128>(I64_MAX)) {
    return Duration::max();
  }
  if (DIFF < static_cast<__int128>(I64_MIN)) {
    return Duration::min();
  }
  return Duration{static_cast<std::int64_t>(DIFF)};
}

/* ----------------------------- Comparison ----------------------------- */

bool Instant::before(const Instant& u) const noexcept {
  if ((wall_ & u.wall_ & HAS_MONOTONIC) != 0) {
    return ext_ < u.ext_;
  }
  const std::int64_t TS = sec();
  const std::int64_t US = u.sec();
  return TS < US || (TS == US && nsec() < u.nsec());
}

bool Instant::after(const Instant& u) const noexcept {
  if ((wall_ & u.wall_ & HAS_MONOTONIC) != 0) {
    return ext_ > u.ext_;
  }
  const std::int64_t TS = sec();
  const std::int64_t US = u.sec();
  return TS > US || (TS == US && nsec() > u.nsec());
}

bool Instant::equal(const Instant& u) const noexcept {
  if ((wall_ & u.wall_ & HAS_MONOTONIC) != 0) {
    return ext_ == u.ext_;
  }
  return sec() == u.sec() && nsec() == u.nsec();
}

/* ----------------------------- Rounding ----------------------------- */

Instant Instant::stripMonotonic() const noexcept {
  Instant t = *this;
  t.stripMono();
  return t;
}

Instant Instant::truncate(Duration d) const noexcept {
  const Instant T = stripMonotonic();
  if (d.nanoseconds() <= 0) {
    return T;
  }
  const Duration R = remainder(T.sec(), T.nsec(), d);
  return T.add(-R);
}

Instant Instant::round(Duration d) const noexcept {
  const Instant T = stripMonotonic();
  if (d.nanoseconds() <= 0) {
    return T;
  }
  const Duration R = remainder(T.sec(), T.nsec(), d);
  if (lessThanHalf(R.nanoseconds(), d.nanoseconds())) {
    return T.add(-R);
  }
  return T.add(d - R);
}

/* ----------------------------- Accessors ----------------------------- */

std::int64_t Instant::unixSeconds() const noexcept { return saturatingAdd(sec(), INTERNAL_TO_UNIX); }

std::int64_t Instant::unixNanos() const noexcept {
  // Wrapping arithmetic outside 1678..2262, see header.
  const std::uint64_t SEC = static_cast<std::uint64_t>(unixSeconds());
  return static_cast<std::int64_t>(SEC * static_cast<std::uint64_t>(NS_PER_SEC) +
                                   static_cast<std::uint64_t>(nsec()));
}

} // namespace time

} // namespace timecache

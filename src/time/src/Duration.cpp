/**
 * @file Duration.cpp
 * @brief Implementation of Duration rounding, accessors and rendering.
 */

#include "src/time/inc/Duration.hpp"

#include <algorithm>
#include <cstring>

namespace timecache {

namespace time {

/* ----------------------------- Internal Helpers ----------------------------- */

namespace {

constexpr std::uint64_t NS_PER_US = 1'000ULL;
constexpr std::uint64_t NS_PER_MS = 1'000'000ULL;
constexpr std::uint64_t NS_PER_SEC = 1'000'000'000ULL;

/// True if x + x < y, computed without overflow (x and y non-negative).
constexpr bool lessThanHalf(std::int64_t x, std::int64_t y) noexcept {
  return static_cast<std::uint64_t>(x) + static_cast<std::uint64_t>(x) <
         static_cast<std::uint64_t>(y);
}

/**
 * Write the fraction v / 10^prec (e.g. ".125") ending at index w of buf,
 * dropping trailing zeros and the point itself when the fraction is zero.
 * Returns the new start index; v is left holding v / 10^prec.
 */
std::size_t writeFrac(char* buf, std::size_t w, std::uint64_t& v, int prec) noexcept {
  bool print = false;
  for (int i = 0; i < prec; ++i) {
    const std::uint64_t DIGIT = v % 10;
    print = print || DIGIT != 0;
    if (print) {
      buf[--w] = static_cast<char>('0' + DIGIT);
    }
    v /= 10;
  }
  if (print) {
    buf[--w] = '.';
  }
  return w;
}

/// Write v in decimal ending at index w of buf. Returns the new start index.
std::size_t writeInt(char* buf, std::size_t w, std::uint64_t v) noexcept {
  if (v == 0) {
    buf[--w] = '0';
    return w;
  }
  while (v > 0) {
    buf[--w] = static_cast<char>('0' + v % 10);
    v /= 10;
  }
  return w;
}

} // namespace

/* ----------------------------- Accessors ----------------------------- */

double Duration::seconds() const noexcept {
  const std::int64_t SEC = ns_ / SECOND.ns_;
  const std::int64_t NSEC = ns_ % SECOND.ns_;
  return static_cast<double>(SEC) + static_cast<double>(NSEC) / 1e9;
}

double Duration::minutes() const noexcept {
  const std::int64_t MIN = ns_ / MINUTE.ns_;
  const std::int64_t NSEC = ns_ % MINUTE.ns_;
  return static_cast<double>(MIN) + static_cast<double>(NSEC) / (60 * 1e9);
}

double Duration::hours() const noexcept {
  const std::int64_t HRS = ns_ / HOUR.ns_;
  const std::int64_t NSEC = ns_ % HOUR.ns_;
  return static_cast<double>(HRS) + static_cast<double>(NSEC) / (60 * 60 * 1e9);
}

/* ----------------------------- Rounding ----------------------------- */

Duration Duration::truncate(Duration m) const noexcept {
  if (m.ns_ <= 0) {
    return *this;
  }
  return Duration{ns_ - ns_ % m.ns_};
}

Duration Duration::round(Duration m) const noexcept {
  if (m.ns_ <= 0) {
    return *this;
  }

  std::int64_t r = ns_ % m.ns_;
  std::int64_t out = 0;

  if (ns_ < 0) {
    r = -r;
    if (lessThanHalf(r, m.ns_)) {
      return Duration{ns_ + r};
    }
    // Away from zero: d - (m - r)
    if (__builtin_sub_overflow(ns_, m.ns_ - r, &out)) {
      return min();
    }
    return Duration{out};
  }

  if (lessThanHalf(r, m.ns_)) {
    return Duration{ns_ - r};
  }
  if (__builtin_add_overflow(ns_, m.ns_ - r, &out)) {
    return max();
  }
  return Duration{out};
}

/* ----------------------------- Rendering ----------------------------- */

std::size_t Duration::format(std::span<char> out) const noexcept {
  // Largest rendering is "-2562047h47m16.854775808s" (25 bytes).
  std::array<char, DURATION_STRING_MAX> buf{};
  std::size_t w = buf.size();
  char* const B = buf.data();

  const bool NEG = ns_ < 0;
  std::uint64_t u = static_cast<std::uint64_t>(ns_);
  if (NEG) {
    u = 0 - u;
  }

  if (u < NS_PER_SEC) {
    // Under one second: pick the unit that keeps the leading digit non-zero.
    if (u == 0) {
      static constexpr char ZERO[] = "0s";
      const std::size_t LEN = std::min(out.size(), sizeof(ZERO) - 1);
      if (LEN > 0) {
        std::memcpy(out.data(), ZERO, LEN);
      }
      return LEN;
    }

    int prec = 0;
    B[--w] = 's';
    if (u < NS_PER_US) {
      prec = 0;
      B[--w] = 'n';
    } else if (u < NS_PER_MS) {
      // U+00B5 MICRO SIGN, two bytes in UTF-8
      prec = 3;
      B[--w] = '\xB5';
      B[--w] = '\xC2';
    } else {
      prec = 6;
      B[--w] = 'm';
    }
    w = writeFrac(B, w, u, prec);
    w = writeInt(B, w, u);
  } else {
    B[--w] = 's';
    w = writeFrac(B, w, u, 9);

    // u is now whole seconds
    w = writeInt(B, w, u % 60);
    u /= 60;

    // u is now whole minutes
    if (u > 0) {
      B[--w] = 'm';
      w = writeInt(B, w, u % 60);
      u /= 60;

      // u is now whole hours; stop here since days vary in length
      if (u > 0) {
        B[--w] = 'h';
        w = writeInt(B, w, u);
      }
    }
  }

  if (NEG) {
    B[--w] = '-';
  }

  const std::size_t LEN = std::min(out.size(), buf.size() - w);
  if (LEN > 0) {
    std::memcpy(out.data(), B + w, LEN);
  }
  return LEN;
}

std::string Duration::toString() const {
  std::array<char, DURATION_STRING_MAX> buf{};
  const std::size_t LEN = format(buf);
  return std::string(buf.data(), LEN);
}

} // namespace time

} // namespace timecache

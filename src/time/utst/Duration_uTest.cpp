/**
 * @file Duration_uTest.cpp
 * @brief Unit tests for timecache::time::Duration.
 *
 * Notes:
 *  - Rendering cases mirror the conventional "72h3m0.5s" notation.
 *  - Rounding is checked both on fixed cases and as properties over a sweep.
 */

#include "src/time/inc/Duration.hpp"

#include <gtest/gtest.h>

#include <array>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <string>

#include <fmt/core.h>

using timecache::time::Duration;
using timecache::time::DURATION_STRING_MAX;
using timecache::time::HOUR;
using timecache::time::MICROSECOND;
using timecache::time::MILLISECOND;
using timecache::time::MINUTE;
using timecache::time::NANOSECOND;
using timecache::time::SECOND;

/* ----------------------------- Rendering Tests ----------------------------- */

/** @test Zero renders as "0s". */
TEST(DurationStringTest, Zero) { EXPECT_EQ(Duration{}.toString(), "0s"); }

/** @test Sub-second values use the largest unit with a non-zero leading digit. */
TEST(DurationStringTest, SubSecondUnits) {
  EXPECT_EQ(NANOSECOND.toString(), "1ns");
  EXPECT_EQ((999 * NANOSECOND).toString(), "999ns");
  EXPECT_EQ(MICROSECOND.toString(), "1\xC2\xB5s");
  EXPECT_EQ((1500 * NANOSECOND).toString(), "1.5\xC2\xB5s");
  EXPECT_EQ((1500 * MICROSECOND).toString(), "1.5ms");
  EXPECT_EQ((100 * MILLISECOND).toString(), "100ms");
  EXPECT_EQ((999'999'999 * NANOSECOND).toString(), "999.999999ms");
}

/** @test Values of one second or more use h/m/s with a trailing seconds field. */
TEST(DurationStringTest, HoursMinutesSeconds) {
  EXPECT_EQ(SECOND.toString(), "1s");
  EXPECT_EQ((2 * SECOND + 100 * MILLISECOND).toString(), "2.1s");
  EXPECT_EQ(MINUTE.toString(), "1m0s");
  EXPECT_EQ((HOUR + MINUTE + SECOND).toString(), "1h1m1s");
  EXPECT_EQ((72 * HOUR + 3 * MINUTE + 500 * MILLISECOND).toString(), "72h3m0.5s");
  EXPECT_EQ((SECOND + NANOSECOND).toString(), "1.000000001s");
}

/** @test Negative values carry a leading minus. */
TEST(DurationStringTest, Negative) {
  EXPECT_EQ((-NANOSECOND).toString(), "-1ns");
  EXPECT_EQ((-1500 * MILLISECOND).toString(), "-1.5s");
  EXPECT_EQ((-(HOUR + 30 * MINUTE)).toString(), "-1h30m0s");
}

/** @test The extremes fit in DURATION_STRING_MAX. */
TEST(DurationStringTest, Extremes) {
  EXPECT_EQ(Duration::min().toString(), "-2562047h47m16.854775808s");
  EXPECT_EQ(Duration::max().toString(), "2562047h47m16.854775807s");
  EXPECT_LT(Duration::min().toString().size(), DURATION_STRING_MAX);
}

/** @test format() into a short buffer truncates instead of overflowing. */
TEST(DurationStringTest, FormatShortBuffer) {
  std::array<char, 3> buf{};
  const std::size_t LEN = (HOUR + MINUTE + SECOND).format(buf);
  EXPECT_EQ(LEN, 3U);
  EXPECT_EQ(std::string(buf.data(), LEN), "1h1");
}

/** @test fmt renders the same text as toString(). */
TEST(DurationStringTest, FmtFormatter) {
  const Duration D = 1500 * MICROSECOND;
  EXPECT_EQ(fmt::format("{}", D), D.toString());
  EXPECT_EQ(fmt::format("[{:>8}]", D), "[   1.5ms]");
}

/* ----------------------------- Accessor Tests ----------------------------- */

/** @test Integer accessors truncate toward zero. */
TEST(DurationAccessorTest, IntegerUnits) {
  const Duration D = 1'234'567'891 * NANOSECOND;
  EXPECT_EQ(D.nanoseconds(), 1'234'567'891);
  EXPECT_EQ(D.microseconds(), 1'234'567);
  EXPECT_EQ(D.milliseconds(), 1'234);
  EXPECT_EQ((-D).milliseconds(), -1'234);
}

/** @test Floating accessors. */
TEST(DurationAccessorTest, FloatingUnits) {
  EXPECT_DOUBLE_EQ((1500 * MILLISECOND).seconds(), 1.5);
  EXPECT_DOUBLE_EQ((90 * SECOND).minutes(), 1.5);
  EXPECT_DOUBLE_EQ((90 * MINUTE).hours(), 1.5);
  EXPECT_DOUBLE_EQ((-(30 * MINUTE)).hours(), -0.5);
}

/** @test Conversion to and from std::chrono. */
TEST(DurationAccessorTest, ChronoInterop) {
  const Duration D = Duration::fromChrono(std::chrono::milliseconds{250});
  EXPECT_EQ(D, 250 * MILLISECOND);
  EXPECT_EQ(D.toChrono(), std::chrono::nanoseconds{250'000'000});
}

/* ----------------------------- Arithmetic Tests ----------------------------- */

/** @test Addition and subtraction saturate instead of wrapping. */
TEST(DurationArithmeticTest, Saturation) {
  EXPECT_EQ(Duration::max() + NANOSECOND, Duration::max());
  EXPECT_EQ(Duration::min() - NANOSECOND, Duration::min());
  EXPECT_EQ(-Duration::min(), Duration::max());
  EXPECT_EQ(Duration::max() * 2, Duration::max());
  EXPECT_EQ(Duration::max() * -2, Duration::min());
  EXPECT_EQ(HOUR * 3, 3 * HOUR);
}

/** @test Division and remainder by another duration. */
TEST(DurationArithmeticTest, DivisionAndRemainder) {
  EXPECT_EQ((HOUR + 30 * MINUTE) / MINUTE, 90);
  EXPECT_EQ((HOUR + 30 * SECOND) % MINUTE, 30 * SECOND);
  EXPECT_EQ((-(90 * SECOND)) % MINUTE, -30 * SECOND);
}

/** @test Compound assignment. */
TEST(DurationArithmeticTest, CompoundAssignment) {
  Duration d = SECOND;
  d += 500 * MILLISECOND;
  EXPECT_EQ(d, 1500 * MILLISECOND);
  d -= 2 * SECOND;
  EXPECT_EQ(d, -500 * MILLISECOND);
}

/* ----------------------------- Rounding Tests ----------------------------- */

/** @test Non-positive multiples leave the value unchanged. */
TEST(DurationRoundTest, NonPositiveMultipleIsIdentity) {
  const Duration D = 1'234'567 * NANOSECOND;
  EXPECT_EQ(D.round(Duration{}), D);
  EXPECT_EQ(D.round(-SECOND), D);
  EXPECT_EQ(D.truncate(Duration{}), D);
  EXPECT_EQ(D.truncate(-SECOND), D);
}

/** @test Fixed rounding cases, halfway values away from zero. */
TEST(DurationRoundTest, FixedCases) {
  EXPECT_EQ((1500 * MILLISECOND).round(SECOND), 2 * SECOND);
  EXPECT_EQ((1499 * MILLISECOND).round(SECOND), SECOND);
  EXPECT_EQ((-1500 * MILLISECOND).round(SECOND), -2 * SECOND);
  EXPECT_EQ((-1499 * MILLISECOND).round(SECOND), -SECOND);
  EXPECT_EQ((2500 * MILLISECOND).round(SECOND), 3 * SECOND);
  EXPECT_EQ((59 * MINUTE + 31 * SECOND).round(MINUTE), HOUR);
}

/** @test Rounding near the extremes saturates. */
TEST(DurationRoundTest, SaturatesAtExtremes) {
  EXPECT_EQ(Duration::max().round(HOUR), Duration::max());
  EXPECT_EQ(Duration::min().round(HOUR), Duration::min());
}

/** @test Fixed truncation cases, toward zero. */
TEST(DurationTruncateTest, FixedCases) {
  EXPECT_EQ((1999 * MILLISECOND).truncate(SECOND), SECOND);
  EXPECT_EQ((-1999 * MILLISECOND).truncate(SECOND), -SECOND);
  EXPECT_EQ((HOUR + 59 * MINUTE).truncate(HOUR), HOUR);
}

/** @test Sweep: round and truncate land on multiples within one step. */
TEST(DurationRoundTest, PropertiesOverSweep) {
  const std::array<Duration, 4> MULTIPLES{7 * NANOSECOND, MICROSECOND, 3 * MILLISECOND, SECOND};

  for (const Duration M : MULTIPLES) {
    for (std::int64_t raw = -5'000'000'003; raw <= 5'000'000'003; raw += 333'333'331) {
      const Duration D{raw};

      const Duration T = D.truncate(M);
      EXPECT_EQ((T % M).nanoseconds(), 0) << D.toString() << " / " << M.toString();
      EXPECT_LT(std::abs((D - T).nanoseconds()), M.nanoseconds());

      const Duration R = D.round(M);
      EXPECT_EQ((R % M).nanoseconds(), 0) << D.toString() << " / " << M.toString();
      const std::int64_t DIST = std::abs((D - R).nanoseconds());
      EXPECT_LE(2 * DIST, M.nanoseconds());
    }
  }
}

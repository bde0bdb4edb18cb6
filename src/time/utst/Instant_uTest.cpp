/**
 * @file Instant_uTest.cpp
 * @brief Unit tests for timecache::time::Instant.
 *
 * Notes:
 *  - Clock-reading tests assert invariants, not exact values.
 *  - Fixed instants are built with fromUnix() so results are deterministic.
 */

#include "src/time/inc/Instant.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <thread>

using timecache::time::CheckedAdd;
using timecache::time::Duration;
using timecache::time::HOUR;
using timecache::time::Instant;
using timecache::time::MILLISECOND;
using timecache::time::MINUTE;
using timecache::time::NANOSECOND;
using timecache::time::SECOND;
using timecache::time::UNIX_TO_INTERNAL;

/* ----------------------------- Construction Tests ----------------------------- */

/** @test The default Instant is the zero Instant. */
TEST(InstantTest, DefaultIsZero) {
  const Instant T{};
  EXPECT_TRUE(T.isZero());
  EXPECT_FALSE(T.hasMonotonic());
  EXPECT_EQ(T.unixSeconds(), -UNIX_TO_INTERNAL);
  EXPECT_TRUE(Instant::fromUnix(-UNIX_TO_INTERNAL, 0).isZero());
  EXPECT_FALSE(Instant::fromUnix(0, 0).isZero());
}

/** @test now() carries a monotonic reading and a plausible wall time. */
TEST(InstantTest, NowHasMonotonic) {
  const Instant T = Instant::now();
  EXPECT_TRUE(T.hasMonotonic());
  EXPECT_GT(T.monotonic(), 0);
  EXPECT_FALSE(T.isZero());

  // After 2020-01-01 and before the end of the packed window.
  EXPECT_GT(T.unixSeconds(), 1'577'836'800);
  EXPECT_LT(T.unixSeconds(), 5'900'000'000);
}

/** @test Successive now() readings never go backwards. */
TEST(InstantTest, NowIsMonotonic) {
  Instant prev = Instant::now();
  for (int i = 0; i < 1000; ++i) {
    const Instant CUR = Instant::now();
    EXPECT_FALSE(CUR.before(prev));
    EXPECT_GE(CUR.monotonic(), prev.monotonic());
    prev = CUR;
  }
}

/** @test fromUnix() borrows from seconds for negative nanoseconds. */
TEST(InstantTest, FromUnixNormalizesNegativeNanos) {
  const Instant A = Instant::fromUnix(10, -1);
  const Instant B = Instant::fromUnix(9, 999'999'999);
  EXPECT_TRUE(A.equal(B));
  EXPECT_EQ(A.unixSeconds(), 9);
  EXPECT_EQ(A.nanosecond(), 999'999'999);
}

/** @test fromUnix() carries large and negative nanosecond counts. */
TEST(InstantTest, FromUnixNormalizesOutOfRangeNanos) {
  const Instant A = Instant::fromUnix(0, 2'500'000'000);
  EXPECT_EQ(A.unixSeconds(), 2);
  EXPECT_EQ(A.nanosecond(), 500'000'000);

  const Instant B = Instant::fromUnix(-1, -1'500'000'000);
  EXPECT_EQ(B.unixSeconds(), -3);
  EXPECT_EQ(B.nanosecond(), 500'000'000);

  for (std::int64_t ns = -3'000'000'001; ns <= 3'000'000'001; ns += 250'000'001) {
    const Instant T = Instant::fromUnix(100, ns);
    EXPECT_GE(T.nanosecond(), 0);
    EXPECT_LT(T.nanosecond(), 1'000'000'000);
    EXPECT_EQ(T.unixNanos(), 100'000'000'000 + ns);
  }
}

/** @test fromUnix() never carries a monotonic reading. */
TEST(InstantTest, FromUnixIsWallOnly) {
  EXPECT_FALSE(Instant::fromUnix(1'700'000'000, 0).hasMonotonic());
  EXPECT_EQ(Instant::fromUnix(1'700'000'000, 0).monotonic(), 0);
}

/* ----------------------------- Arithmetic Tests ----------------------------- */

/** @test add() of sub() result reproduces the later instant. */
TEST(InstantTest, SubThenAddRoundTrip) {
  const Instant T = Instant::now();
  std::this_thread::sleep_for(std::chrono::milliseconds{2});
  const Instant U = Instant::now();

  const Duration D = U.sub(T);
  EXPECT_GT(D, Duration{});
  EXPECT_TRUE(T.add(D).equal(U));
  EXPECT_EQ(T.sub(U), -D);
}

/** @test Round trip also holds on the wall-only path. */
TEST(InstantTest, SubThenAddRoundTripWallOnly) {
  const Instant T = Instant::fromUnix(1'000, 999'999'999);
  const Instant U = Instant::fromUnix(-5'000, 1);

  const Duration D = U.sub(T);
  EXPECT_EQ(D, -(6'000 * SECOND + 999'999'998 * NANOSECOND));
  EXPECT_TRUE(T.add(D).equal(U));
}

/** @test add() moves both readings by the same amount. */
TEST(InstantTest, AddAdvancesBothReadings) {
  const Instant T = Instant::now();
  const Instant U = T.add(90 * SECOND);

  EXPECT_TRUE(U.hasMonotonic());
  EXPECT_EQ(U.monotonic() - T.monotonic(), (90 * SECOND).nanoseconds());
  EXPECT_EQ(U.stripMonotonic().sub(T.stripMonotonic()), 90 * SECOND);
  EXPECT_EQ(U.sub(T), 90 * SECOND);
}

/** @test Mixed operands fall back to the wall readings. */
TEST(InstantTest, MixedOperandsUseWall) {
  const Instant T = Instant::now();
  const Instant W = T.stripMonotonic();

  EXPECT_TRUE(T.equal(W));
  EXPECT_TRUE(W.equal(T));
  EXPECT_EQ(T.sub(W), Duration{});

  const Instant LATER = W.add(SECOND);
  EXPECT_TRUE(T.before(LATER));
  EXPECT_TRUE(LATER.after(T));
  EXPECT_EQ(LATER.sub(T), SECOND);
}

/** @test sub() saturates far outside the Duration range. */
TEST(InstantTest, SubSaturates) {
  const Instant FAR = Instant::fromUnix(std::numeric_limits<std::int64_t>::max() / 2, 0);
  EXPECT_EQ(FAR.sub(Instant{}), Duration::max());
  EXPECT_EQ(Instant{}.sub(FAR), Duration::min());
}

/** @test addChecked() reports a dropped monotonic reading. */
TEST(InstantTest, AddCheckedReportsDrop) {
  const Instant T = Instant::now();

  const CheckedAdd SMALL = T.addChecked(MINUTE);
  EXPECT_FALSE(SMALL.monotonicDropped);
  EXPECT_TRUE(SMALL.value.hasMonotonic());

  // Two centuries out leaves the packed window (it ends in 2157).
  const CheckedAdd FAR = T.addChecked(200 * 365 * 24 * HOUR);
  EXPECT_TRUE(FAR.monotonicDropped);
  EXPECT_FALSE(FAR.value.hasMonotonic());
  EXPECT_TRUE(FAR.value.equal(T.add(200 * 365 * 24 * HOUR)));
  EXPECT_EQ(FAR.value.sub(T), 200 * 365 * 24 * HOUR);

  const CheckedAdd WALL = Instant::fromUnix(0, 0).addChecked(HOUR);
  EXPECT_FALSE(WALL.monotonicDropped);
}

/** @test Overflowing the monotonic reading degrades to wall-only. */
TEST(InstantTest, MonotonicOverflowDegrades) {
  const Instant T = Instant::now();
  const Instant U = T.add(Duration::max());
  EXPECT_FALSE(U.hasMonotonic());
  EXPECT_TRUE(U.after(T));
}

/* ----------------------------- Comparison Tests ----------------------------- */

/** @test Ordering on wall-only instants. */
TEST(InstantTest, OrderingWallOnly) {
  const Instant A = Instant::fromUnix(1, 0);
  const Instant B = Instant::fromUnix(1, 1);

  EXPECT_TRUE(A.before(B));
  EXPECT_FALSE(B.before(A));
  EXPECT_TRUE(B.after(A));
  EXPECT_FALSE(A.equal(B));
  EXPECT_FALSE(A.before(A));
  EXPECT_TRUE(A.equal(A));
}

/* ----------------------------- Rounding Tests ----------------------------- */

/** @test truncate() and round() on positive Unix times. */
TEST(InstantRoundTest, PositiveTimes) {
  const Instant T = Instant::fromUnix(0, 1'500'000'000);
  EXPECT_TRUE(T.truncate(SECOND).equal(Instant::fromUnix(1, 0)));
  EXPECT_TRUE(T.round(SECOND).equal(Instant::fromUnix(2, 0)));

  const Instant U = Instant::fromUnix(5 * 3'600 + 17, 0);
  EXPECT_TRUE(U.truncate(HOUR).equal(Instant::fromUnix(5 * 3'600, 0)));
  EXPECT_TRUE(U.round(HOUR).equal(Instant::fromUnix(5 * 3'600, 0)));
}

/** @test Halfway values round up, also before the Unix epoch. */
TEST(InstantRoundTest, HalfwayRoundsUp) {
  const Instant T = Instant::fromUnix(-1, 500'000'000); // -0.5 s
  EXPECT_TRUE(T.truncate(SECOND).equal(Instant::fromUnix(-1, 0)));
  EXPECT_TRUE(T.round(SECOND).equal(Instant::fromUnix(0, 0)));
}

/** @test Times before the zero Instant round toward +infinity on ties. */
TEST(InstantRoundTest, BeforeZeroInstant) {
  const Instant T = Instant{}.add(-1'500 * MILLISECOND);
  EXPECT_TRUE(T.truncate(SECOND).equal(Instant{}.add(-2 * SECOND)));
  EXPECT_TRUE(T.round(SECOND).equal(Instant{}.add(-SECOND)));

  const Instant U = Instant{}.add(-1'400 * MILLISECOND);
  EXPECT_TRUE(U.round(SECOND).equal(Instant{}.add(-SECOND)));
}

/** @test Rounding always drops the monotonic reading. */
TEST(InstantRoundTest, DropsMonotonic) {
  const Instant T = Instant::now();
  EXPECT_FALSE(T.truncate(SECOND).hasMonotonic());
  EXPECT_FALSE(T.round(MILLISECOND).hasMonotonic());

  const Instant SAME = T.round(Duration{});
  EXPECT_FALSE(SAME.hasMonotonic());
  EXPECT_TRUE(SAME.equal(T));
  EXPECT_TRUE(T.truncate(-SECOND).equal(T));
}

/** @test Results are multiples of d within one step of the input. */
TEST(InstantRoundTest, ResultsAreMultiples) {
  const Instant BASE = Instant::fromUnix(1'234'567'890, 123'456'789);
  const Duration STEP = 7 * MILLISECOND;

  const Instant T = BASE.truncate(STEP);
  const Instant R = BASE.round(STEP);
  EXPECT_FALSE(T.after(BASE));
  EXPECT_LT(BASE.sub(T), STEP);
  EXPECT_LE(2 * std::abs(BASE.sub(R).nanoseconds()), STEP.nanoseconds());
  EXPECT_TRUE(T.truncate(STEP).equal(T));
  EXPECT_TRUE(R.truncate(STEP).equal(R));
}

/* ----------------------------- Accessor Tests ----------------------------- */

/** @test Unix seconds and nanoseconds. */
TEST(InstantTest, UnixAccessors) {
  const Instant T = Instant::fromUnix(1, 5);
  EXPECT_EQ(T.unixSeconds(), 1);
  EXPECT_EQ(T.unixNanos(), 1'000'000'005);
  EXPECT_EQ(T.nanosecond(), 5);

  const Instant NOW = Instant::now();
  EXPECT_EQ(NOW.unixNanos() / 1'000'000'000, NOW.unixSeconds());
}

/** @test since() and until() agree with sub() around now(). */
TEST(InstantTest, SinceAndUntil) {
  const Instant T = Instant::now();
  std::this_thread::sleep_for(std::chrono::milliseconds{1});

  const Duration ELAPSED = Instant::since(T);
  EXPECT_GE(ELAPSED, MILLISECOND);
  EXPECT_LT(ELAPSED, 10 * SECOND);

  const Duration LEFT = Instant::until(T.add(HOUR));
  EXPECT_GT(LEFT, 59 * MINUTE);
  EXPECT_LE(LEFT, HOUR);

  // Wall-only argument
  const Duration WALL_ELAPSED = Instant::since(T.stripMonotonic());
  EXPECT_GT(WALL_ELAPSED, Duration{});
}

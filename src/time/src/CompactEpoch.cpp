/**
 * @file CompactEpoch.cpp
 * @brief Implementation of CompactEpoch clock capture and conversions.
 */

#include "src/time/inc/CompactEpoch.hpp"
#include "src/helpers/inc/Clock.hpp"

namespace timecache {

namespace time {

CompactEpoch CompactEpoch::now() noexcept {
  // No monotonic reading needed: only whole wall seconds survive.
  return CompactEpoch{static_cast<std::uint32_t>(helpers::clock::readWallClock().sec)};
}

CompactEpoch CompactEpoch::fromInstant(const Instant& t) noexcept {
  return CompactEpoch{static_cast<std::uint32_t>(t.unixSeconds())};
}

Instant CompactEpoch::toInstant() const noexcept {
  return Instant::fromUnix(static_cast<std::int64_t>(sec_), 0);
}

} // namespace time

} // namespace timecache

// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Detection and repair of time stamps that do not increase
// monotonically. Instrument clocks occasionally jump backwards (e.g.
// after a GPS resync) which breaks every consumer that expects a
// sorted time axis.

#pragma once

#include <common/constants.h>
#include <common/eigen.h>

namespace echomerge {

// Whether some time stamp is smaller than or equal to its predecessor
[[nodiscard]] auto existReversedTime(const ArrayXl& time) -> bool;

// Return a strictly increasing copy of time. Whenever a time stamp
// (shifted by the current offset) does not exceed its corrected
// predecessor, the offset is raised so that it lands exactly one
// increment above the predecessor. The offset applies to all
// following time stamps until another reversal raises it further.
// Example with increment 1: [10, 20, 15, 30] -> [10, 20, 21, 36].
[[nodiscard]] auto coerceIncreasingTime(
  const ArrayXl& time,
  const int64_t increment = timing::increment) -> ArrayXl;

} // namespace echomerge

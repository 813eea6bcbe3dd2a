// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "time_reversal.h"

namespace echomerge {

auto existReversedTime(const ArrayXl& time) -> bool
{
    for (Eigen::Index i { 1 }; i < time.size(); ++i) {
        if (time(i) <= time(i - 1)) {
            return true;
        }
    }
    return false;
}

auto coerceIncreasingTime(const ArrayXl& time,
                          const int64_t increment) -> ArrayXl
{
    ArrayXl corrected(time.size());
    int64_t offset {};
    for (Eigen::Index i {}; i < time.size(); ++i) {
        if (i > 0 && time(i) + offset <= corrected(i - 1)) {
            offset = corrected(i - 1) + increment - time(i);
        }
        corrected(i) = time(i) + offset;
    }
    return corrected;
}

} // namespace echomerge

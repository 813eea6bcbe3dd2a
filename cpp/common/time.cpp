// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "time.h"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace echomerge {

auto formatTimestamp(const std::chrono::system_clock::time_point time)
  -> std::string
{
    const std::time_t t { std::chrono::system_clock::to_time_t(time) };
    std::tm utc {};
    gmtime_r(&t, &utc);
    std::ostringstream stream {};
    stream << std::put_time(&utc, "%FT%TZ");
    return stream.str();
}

auto getDateAndTime() -> std::string
{
    return formatTimestamp(std::chrono::system_clock::now());
}

} // namespace echomerge

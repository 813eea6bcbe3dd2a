// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "timer.h"

#include <numeric>

namespace echomerge {

auto Timer::lap(const std::string& stage) -> void
{
    const Clock::time_point now { Clock::now() };
    stage_times.emplace_back(
      stage, std::chrono::duration<double>(now - stage_start).count());
    stage_start = now;
}

auto Timer::total() const -> double
{
    return std::accumulate(
      stage_times.begin(),
      stage_times.end(),
      0.0,
      [](const double sum, const auto& stage) { return sum + stage.second; });
}

} // namespace echomerge

// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Wall clock time spent in each stage of a run

#pragma once

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace echomerge {

class Timer
{
private:
    using Clock = std::chrono::steady_clock;
    Clock::time_point stage_start { Clock::now() };
    // Name and duration [s] of each completed stage
    std::vector<std::pair<std::string, double>> stage_times {};

public:
    Timer() = default;
    // Close the current stage under the given name and start the next
    auto lap(const std::string& stage) -> void;
    [[nodiscard]] auto stages() const
      -> const std::vector<std::pair<std::string, double>>&
    {
        return stage_times;
    }
    // Sum over all completed stages [s]
    [[nodiscard]] auto total() const -> double;
};

} // namespace echomerge

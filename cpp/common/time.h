// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// UTC time stamps of the history and conversion_time attributes

#pragma once

#include <chrono>
#include <string>

namespace echomerge {

// Format YYYY-mm-ddTHH:MM:SSZ, truncated to whole seconds
auto formatTimestamp(std::chrono::system_clock::time_point time)
  -> std::string;

// Current time in the format above
auto getDateAndTime() -> std::string;

} // namespace echomerge

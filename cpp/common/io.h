// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Functions for formatting the output to stdout and tests for things
// like whether a file is readable/writable.

#pragma once

#include "constants.h"

#include <spdlog/pattern_formatter.h>
#include <string>
#include <vector>

namespace echomerge {

// Define a new spdlog formatter flag. The primary purpose is to show
// labels such as [warning] for warnings but no label for regular
// (info) messages.
class echomerge_formatter_flag : public spdlog::custom_flag_formatter
{
public:
    auto format(const spdlog::details::log_msg& log_msg,
                const std::tm&,
                spdlog::memory_buf_t& dest) -> void override;
    auto clone() const -> std::unique_ptr<custom_flag_formatter> override;
};

// Set up two loggers: one with a verbose pattern (mostly used
// throughout the code) and a plain one (clean pattern, i.e. prints
// just the message text).
auto initLogging() -> void;

// Print the name of a processing section, surrounded by a box of
// hash symbols.
auto printHeading(const std::string& heading,
                  const bool incl_empty_line = true) -> void;

// Print information about the host system and how the executable was
// built.
auto printSystemInfo(const std::string& project_version,
                     const std::string& git_commit,
                     const std::string& cmake_host_system,
                     const std::string& executable,
                     const std::string& compiler,
                     const std::string& compiler_flags,
                     const std::string& libraries) -> void;

// Check if filename exists. If required == true and filename is an
// empty string raise an error, otherwise return without checking.
auto checkPresenceOfFile(const std::string& filename,
                         const std::string& yaml_key,
                         const bool required) -> void;

// Check if destination is writable
auto checkFileWritable(const std::string& filename) -> void;

auto splitString(const std::string& list,
                 const char delimiter) -> std::vector<std::string>;

// Conversions between an attribute combination policy and its name
// as used in configuration files, e.g. "no_conflicts". An unknown
// name is rejected with std::invalid_argument.
[[nodiscard]] auto combineAttrsToString(const CombineAttrs policy)
  -> std::string;
[[nodiscard]] auto combineAttrsFromString(const std::string& name)
  -> CombineAttrs;

} // namespace echomerge

// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "io.h"

#include "time.h"

#include <algorithm>
#include <array>
#include <filesystem>
#include <fstream>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <sstream>
#include <unistd.h>

namespace echomerge {

// Names of the attribute policies in the order of CombineAttrs
static const std::array<std::string,
                        static_cast<size_t>(CombineAttrs::n_policies)>
  combine_attrs_names {
      "override", "drop", "identical", "no_conflicts", "overwrite_conflicts"
  };

auto echomerge_formatter_flag::format(const spdlog::details::log_msg& log_msg,
                                      const std::tm& /* tm_time */,
                                      spdlog::memory_buf_t& dest) -> void
{
    std::string text {};
    switch (log_msg.level) {
    case spdlog::level::info:
        break;
    case spdlog::level::warn:
        text = " [warning]";
        break;
    case spdlog::level::err:
        text = " [error]";
        break;
    case spdlog::level::debug:
        text = " [debug]";
        break;
    case spdlog::level::off:
    case spdlog::level::trace:
    case spdlog::level::critical:
    case spdlog::level::n_levels:
        text = " [unknown]";
    }
    // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    dest.append(text.data(), text.data() + text.size());
}

auto echomerge_formatter_flag::clone() const
  -> std::unique_ptr<custom_flag_formatter>
{
    return spdlog::details::make_unique<echomerge_formatter_flag>();
}

auto initLogging() -> void
{
    // Only if the logger does not already exist
    if (!spdlog::get("plain")) {
        auto formatter { std::make_unique<spdlog::pattern_formatter>() };
        formatter->add_flag<echomerge_formatter_flag>('*').set_pattern(
          "[%H:%M:%S]%* %v");
        spdlog::set_formatter(std::move(formatter));
        spdlog::stdout_color_mt("plain");
        spdlog::get("plain")->set_pattern("%v");
    }
    spdlog::set_level(spdlog::level::info);
}

auto printHeading(const std::string& heading,
                  const bool incl_empty_line) -> void
{
    if (incl_empty_line) {
        spdlog::get("plain")->info("");
    }
    std::string hash_line(heading.size() + 4, '#');
    spdlog::get("plain")->info(hash_line);
    spdlog::get("plain")->info("# " + heading + " #");
    spdlog::get("plain")->info(hash_line);
}

auto printSystemInfo(const std::string& project_version,
                     const std::string& git_commit,
                     const std::string& cmake_host_system,
                     const std::string& executable,
                     const std::string& compiler,
                     const std::string& compiler_flags,
                     const std::string& libraries) -> void
{
    spdlog::get("plain")->info("Version                 : {}", project_version);
    if (git_commit != "GITDIR-N") {
        spdlog::get("plain")->info("Commit hash             : {}", git_commit);
    }
    spdlog::get("plain")->info("Date (UTC)              : {}",
                               getDateAndTime());
    spdlog::get("plain")->info("Host system             : {}",
                               cmake_host_system);
    spdlog::get("plain")->info("Executable location     : {}", executable);
    spdlog::get("plain")->info("C++ compiler            : {}", compiler);
    spdlog::get("plain")->info("C++ compiler flags      : {}", compiler_flags);
    for (bool first_line { true };
         const auto& lib : splitString(libraries, ' ')) {
        if (first_line) {
            spdlog::get("plain")->info("Linking against         : {}", lib);
            first_line = false;
        } else {
            spdlog::get("plain")->info("                          {}", lib);
        }
    }
}

auto checkPresenceOfFile(const std::string& filename,
                         const std::string& yaml_key,
                         const bool required) -> void
{
    if (!required && filename.empty()) {
        return;
    }
    if (filename.empty()) {
        throw std::runtime_error { "missing " + yaml_key };
    }
    try {
        std::ifstream file { filename };
        file.exceptions(std::ifstream::failbit);
    } catch (const std::ifstream::failure& e) {
        const std::string msg { "\nCould not open file: " + filename };
        throw std::ifstream::failure { e.what() + msg, e.code() };
    }
}

auto checkFileWritable(const std::string& filename) -> void
{
    if (!filename.empty()) {
        std::string dir { std::filesystem::path { filename }.parent_path() };
        if (!dir.empty() && static_cast<bool>(access(dir.c_str(), W_OK))) {
            throw std::runtime_error { filename + " is not writable" };
        }
    }
}

auto splitString(const std::string& list,
                 const char delimiter) -> std::vector<std::string>
{
    std::stringstream ss { list };
    std::string name {};
    std::vector<std::string> strings {};
    while (getline(ss, name, delimiter)) {
        strings.push_back(name);
    }
    return strings;
}

[[nodiscard]] auto combineAttrsToString(const CombineAttrs policy)
  -> std::string
{
    if (policy == CombineAttrs::n_policies) {
        throw std::invalid_argument { "invalid attribute policy" };
    }
    return combine_attrs_names.at(static_cast<size_t>(policy));
}

[[nodiscard]] auto combineAttrsFromString(const std::string& name)
  -> CombineAttrs
{
    const auto it { std::ranges::find(combine_attrs_names, name) };
    if (it == combine_attrs_names.end()) {
        throw std::invalid_argument { "unknown attribute policy: " + name };
    }
    return static_cast<CombineAttrs>(
      std::distance(combine_attrs_names.begin(), it));
}

} // namespace echomerge

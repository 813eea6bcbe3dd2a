// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Struct to hold one converted echosounder record: the data of one
// raw file (or of several combined raw files) organized into a fixed
// list of groups. Each group is either a dataset or absent.

#pragma once

#include "dataset.h"

#include <array>
#include <optional>

namespace echomerge {

// Supported instrument models
enum class SonarModel
{
    ek60,
    ek80,
    ea640,
    azfp,
    ad2cp,
    n_models,
};

// The group map. Every record has the same groups in this order.
enum class Group
{
    top,
    environment,
    platform,
    nmea,
    provenance,
    sonar,
    beam,
    beam_power,
    vendor,
    n_groups,
};

constexpr size_t n_groups { static_cast<size_t>(Group::n_groups) };

// All groups in the order of the group map
[[nodiscard]] auto groupMap() -> const std::array<Group, n_groups>&;

// Name of a group as used in the concatenation table and in the
// provenance group, e.g. "beam_power"
[[nodiscard]] auto groupName(const Group group) -> std::string;

// Location of a group in a NetCDF file, e.g. "Platform/NMEA". The top
// group is the root group which has an empty path.
[[nodiscard]] auto groupPath(const Group group) -> std::string;

// Instrument model names as stored in files, e.g. "EK60". An unknown
// name is rejected with std::invalid_argument.
[[nodiscard]] auto sonarModelToString(const SonarModel model) -> std::string;
[[nodiscard]] auto sonarModelFromString(const std::string& name)
  -> SonarModel;

struct EchoData
{
    // Instrument model. Records from a reader that could not
    // determine the model have none.
    std::optional<SonarModel> sonar_model {};

    // Group datasets in the order of the group map. A null pointer
    // means the group is absent. Groups are shared read-only between
    // records.
    std::array<std::shared_ptr<const Dataset>, n_groups> groups {};

    // Raw file the record was converted from, if known
    std::optional<std::string> source_file {};
    // Converted file the record was read from, if any
    std::optional<std::string> converted_raw_path {};

    [[nodiscard]] auto group(const Group group) const
      -> const std::shared_ptr<const Dataset>&
    {
        return groups.at(static_cast<size_t>(group));
    }
    auto setGroup(const Group group, std::shared_ptr<const Dataset> dataset)
      -> void
    {
        groups.at(static_cast<size_t>(group)) = std::move(dataset);
    }
    // Source file if known, otherwise the converted file path
    [[nodiscard]] auto origin() const -> std::string;
};

} // namespace echomerge

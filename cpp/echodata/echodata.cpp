// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "echodata.h"

#include <algorithm>

namespace echomerge {

static const std::array<std::string, n_groups> group_names {
    "top",        "environment", "platform", "nmea",  "provenance",
    "sonar",      "beam",        "beam_power", "vendor",
};

static const std::array<std::string, n_groups> group_paths {
    "",      "Environment", "Platform", "Platform/NMEA", "Provenance",
    "Sonar", "Beam",        "Beam_power", "Vendor",
};

static const std::array<std::string, static_cast<size_t>(SonarModel::n_models)>
  sonar_model_names { "EK60", "EK80", "EA640", "AZFP", "AD2CP" };

auto groupMap() -> const std::array<Group, n_groups>&
{
    static const std::array<Group, n_groups> group_map {
        Group::top,   Group::environment, Group::platform,
        Group::nmea,  Group::provenance,  Group::sonar,
        Group::beam,  Group::beam_power,  Group::vendor,
    };
    return group_map;
}

auto groupName(const Group group) -> std::string
{
    return group_names.at(static_cast<size_t>(group));
}

auto groupPath(const Group group) -> std::string
{
    return group_paths.at(static_cast<size_t>(group));
}

auto sonarModelToString(const SonarModel model) -> std::string
{
    if (model == SonarModel::n_models) {
        throw std::invalid_argument { "invalid sonar model" };
    }
    return sonar_model_names.at(static_cast<size_t>(model));
}

auto sonarModelFromString(const std::string& name) -> SonarModel
{
    const auto it { std::ranges::find(sonar_model_names, name) };
    if (it == sonar_model_names.end()) {
        throw std::invalid_argument { "unknown sonar model: " + name };
    }
    return static_cast<SonarModel>(
      std::distance(sonar_model_names.begin(), it));
}

auto EchoData::origin() const -> std::string
{
    return source_file.value_or(converted_raw_path.value_or(""));
}

} // namespace echomerge

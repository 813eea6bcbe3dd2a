// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "concat_policy.h"

#include <map>

namespace echomerge {

static const std::string default_entry { "default" };

using ConcatTable = std::map<std::string, ConcatSpec>;

static auto ek80Table() -> ConcatTable
{
    return {
        { "platform", { { "location_time", "mru_time" }, VariableMode::minimal } },
        { "nmea", { { "location_time" }, VariableMode::minimal } },
        { "vendor", { {}, VariableMode::minimal } },
        { default_entry, { { "ping_time" }, VariableMode::minimal } },
    };
}

static const std::map<SonarModel, ConcatTable> concat_table {
    { SonarModel::ek60,
      {
        { "platform",
          { { "location_time", "ping_time" }, VariableMode::minimal } },
        { "nmea", { { "location_time" }, VariableMode::minimal } },
        { "vendor", { {}, VariableMode::minimal } },
        { default_entry, { { "ping_time" }, VariableMode::minimal } },
      } },
    { SonarModel::ek80, ek80Table() },
    { SonarModel::ea640, ek80Table() },
    { SonarModel::azfp,
      {
        { "platform", { { "location_time", "ping_time" }, VariableMode::all } },
        { "nmea", { { "location_time" }, VariableMode::minimal } },
        { "vendor", { { "ping_time" }, VariableMode::minimal } },
        { default_entry, { { "ping_time" }, VariableMode::minimal } },
      } },
    { SonarModel::ad2cp,
      {
        { "nmea", { { "location_time" }, VariableMode::all } },
        { "vendor", { {}, VariableMode::all } },
        { default_entry, { { "ping_time" }, VariableMode::all } },
      } },
};

static const std::vector<FixedWidth> ek60_beam_widths {
    { "gpt_software_version", 10 },
    { "channel_id", 50 },
};

static const std::vector<FixedWidth> ek80_beam_widths {
    { "transceiver_software_version", 10 },
    { "channel_id", 50 },
};

auto validateConcatTable() -> void
{
    for (int i {}; i < static_cast<int>(SonarModel::n_models); ++i) {
        const auto model { static_cast<SonarModel>(i) };
        const auto it { concat_table.find(model) };
        if (it == concat_table.end() || !it->second.contains(default_entry)) {
            throw std::logic_error { "no default concatenation entry for "
                                     + sonarModelToString(model) };
        }
    }
}

auto concatSpec(const SonarModel model, const Group group) -> const ConcatSpec&
{
    [[maybe_unused]] static const bool validated { (validateConcatTable(),
                                                    true) };
    const auto& table { concat_table.at(model) };
    if (const auto it { table.find(groupName(group)) }; it != table.end()) {
        return it->second;
    }
    return table.at(default_entry);
}

auto fixedWidthVariables(const SonarModel model,
                         const Group group) -> std::vector<FixedWidth>
{
    if (group != Group::beam) {
        return {};
    }
    switch (model) {
    case SonarModel::ek60:
        return ek60_beam_widths;
    case SonarModel::ek80:
    case SonarModel::ea640:
        return ek80_beam_widths;
    case SonarModel::azfp:
    case SonarModel::ad2cp:
        return {};
    case SonarModel::n_models:
        break;
    }
    throw std::invalid_argument { "invalid sonar model" };
}

} // namespace echomerge

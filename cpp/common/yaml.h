// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Extensions of the YAML library that are necessary to work with
// non-standard types of this project.

#pragma once

#include "constants.h"
#include "setting.h"

#include <yaml-cpp/yaml.h>

// Instruct YAML how to read values into non-standard types
namespace YAML {

template <>
struct convert<echomerge::CombineAttrs>
{
    static auto decode(const Node& node, echomerge::CombineAttrs& rhs) -> bool;
};

} // namespace YAML

namespace echomerge {

auto operator<<(YAML::Emitter& out,
                const CombineAttrs policy) -> YAML::Emitter&;

// Extended Emitter to have a verbosity switch
class Emitter : public YAML::Emitter
{
public:
    bool verbose {};
};

// Instruct YAML how to print the verbose and non-verbose contents of
// a configuration parameter.
template <typename T>
static auto operator<<(Emitter& out, const Setting<T>& setting) -> Emitter&
{
    out << YAML::Key << setting.yaml_keys.back();
    if (out.verbose) {
        out << YAML::Value;
        out << YAML::BeginMap;
        // NOLINTNEXTLINE(cppcoreguidelines-slicing)
        out << YAML::Key << "default" << YAML::Value << static_cast<T>(setting);
        out << YAML::Key << "type" << YAML::Value << setting.type;
        out << YAML::Key << "info" << YAML::Value << YAML::Literal
            << setting.info;
        out << YAML::EndMap;
    } else {
        // NOLINTNEXTLINE(cppcoreguidelines-slicing)
        out << YAML::Value << static_cast<T>(setting);
    }
    return out;
}

} // namespace echomerge

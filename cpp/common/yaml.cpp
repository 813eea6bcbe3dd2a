// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "yaml.h"

#include "io.h"

namespace YAML {

auto convert<echomerge::CombineAttrs>::decode(const Node& node,
                                              echomerge::CombineAttrs& rhs)
  -> bool
{
    // An unknown name is a failed conversion so that the settings
    // report which key it belongs to.
    try {
        rhs = echomerge::combineAttrsFromString(node.as<std::string>());
    } catch (const std::invalid_argument&) {
        return false;
    }
    return true;
}

} // namespace YAML

namespace echomerge {

auto operator<<(YAML::Emitter& out,
                const CombineAttrs policy) -> YAML::Emitter&
{
    out << combineAttrsToString(policy);
    return out;
}

} // namespace echomerge

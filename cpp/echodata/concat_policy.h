// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Static configuration describing, for each instrument model and
// group, along which dimensions records are joined and which
// variables are joined. Also lists the string variables that are
// normalized to a fixed width after joining.

#pragma once

#include "echodata.h"

namespace echomerge {

struct ConcatSpec
{
    // Concatenation dimensions in order of preference. Empty means
    // the datasets are merged instead of concatenated.
    std::vector<std::string> dims {};
    VariableMode mode { VariableMode::minimal };
};

struct FixedWidth
{
    std::string variable {};
    size_t width {};
};

// Entry for the group or, if the group has none, the default entry
// of the model. The table is checked on first use.
[[nodiscard]] auto concatSpec(const SonarModel model,
                              const Group group) -> const ConcatSpec&;

// Throw std::logic_error if some model lacks a default entry
auto validateConcatTable() -> void;

// String variables of a group that are given a fixed width
[[nodiscard]] auto fixedWidthVariables(const SonarModel model,
                                       const Group group)
  -> std::vector<FixedWidth>;

} // namespace echomerge

// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// The provenance group records where a combined record came from:
// the source files, which software combined them and when, and the
// metadata that was overwritten while combining.

#pragma once

#include "echodata.h"

namespace echomerge {

// Name and version of the software that produced a record
struct SoftwareIdentity
{
    std::string name {};
    std::string version {};
};

// This software, with the version the project was built with
[[nodiscard]] auto defaultSoftwareIdentity() -> SoftwareIdentity;

// Provenance group with a "file" dimension and the variable
// src_filenames listing origins in order. The attributes hold the
// software identity and the current UTC time (YYYY-mm-ddTHH:MM:SSZ).
[[nodiscard]] auto assembleProvenance(
  const std::vector<std::string>& origins,
  const SoftwareIdentity& identity,
  const DatasetBackend& backend = memoryBackend()) -> std::unique_ptr<Dataset>;

// Store the time coordinate as it was before correction under the
// name old_<field>, over a dimension of the same name. Throws
// std::invalid_argument if that name is already taken.
auto appendOldTime(Dataset& provenance,
                   const std::string& field,
                   const Variable& time) -> void;

// For each group, store the attributes of every dataset that
// contributed to it as the variable <group>_attrs over the dimension
// <group>_file. Throws std::invalid_argument if a name is already
// taken.
auto appendGroupAttrs(
  Dataset& provenance,
  const std::vector<std::pair<Group, std::vector<Attrs>>>& group_attrs)
  -> void;

} // namespace echomerge

// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Combine several converted records of one deployment into a single
// record.

#pragma once

#include "provenance.h"

namespace echomerge {

// Name of the acquisition time coordinate. This is the only time axis
// that is checked for reversals.
constexpr std::string_view time_coord { "ping_time" };

// Dimension that concatenating along several dimensions at once may
// leave behind. It is never part of a combined group.
constexpr std::string_view synthetic_concat_dim { "concat_dim" };

// Combine records in the given order:
//
//   - All records must have the same non-null instrument model,
//     otherwise ValidationError is thrown before anything else.
//   - The top and sonar groups are taken from the first record.
//   - The provenance group is rebuilt from the origins of the records.
//   - Every other group is concatenated over the records that have it
//     according to the concatenation table of the model, with global
//     attributes reduced by combine_attrs. Attributes of the datasets
//     are kept in the provenance group if more than one contributed.
//   - The first time a ping_time reversal is found, a warning is
//     logged and the corrected time axis is used in that group and
//     every following group with a ping_time coordinate. The
//     uncorrected axis is kept in the provenance group.
//
// The input records are not modified. An empty list gives a record
// with all groups absent.
[[nodiscard]] auto combineEchodata(
  const std::vector<EchoData>& echodatas,
  const CombineAttrs combine_attrs = CombineAttrs::override,
  const SoftwareIdentity& identity = defaultSoftwareIdentity(),
  const DatasetBackend& backend = memoryBackend()) -> EchoData;

} // namespace echomerge

// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#pragma once

#include <cstdint>

namespace echomerge {

// Fill values to denote a missing or default value
namespace fill {

constexpr int i { -32767 };

} // namespace fill

// Time stamps are held as integer nanoseconds since an epoch
namespace timing {

// Smallest representable step of a time coordinate [ns]
constexpr int64_t increment { 1 };
constexpr int64_t ns_per_us { 1000 };
constexpr int64_t ns_per_ms { 1000 * ns_per_us };
constexpr int64_t ns_per_s { 1000 * ns_per_ms };
constexpr int64_t ns_per_min { 60 * ns_per_s };
constexpr int64_t ns_per_hour { 60 * ns_per_min };
constexpr int64_t ns_per_day { 24 * ns_per_hour };

} // namespace timing

// Compression will be enabled only when requested by the user
constexpr int compression_level { 5 };

// How the global attributes of datasets that are joined into one are
// reconciled
enum class CombineAttrs
{
    override,            // Copy attributes of the first dataset
    drop,                // Empty attributes
    identical,           // All must be equal
    no_conflicts,        // Union, shared keys must have equal values
    overwrite_conflicts, // Union, later datasets win
    n_policies,
};

} // namespace echomerge

// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Reading and writing records as NetCDF-4 files. Each group of the
// group map is stored at its path (see groupPath) and the attributes
// of the root group form the top group.

#pragma once

#include "echodata.h"

namespace echomerge {

// Read a record from a NetCDF file. The instrument model is taken
// from the root attribute "keywords" and is left unset if missing or
// not recognized. Time variables with units "<unit> since <epoch>"
// are converted to integer nanoseconds.
[[nodiscard]] auto readRecord(const std::string& filename) -> EchoData;

// Write all groups present in the record to a NetCDF file, replacing
// an existing file. Numeric variables are compressed if compress is
// true.
auto writeRecord(const std::string& filename,
                 const EchoData& record,
                 const bool compress = true) -> void;

} // namespace echomerge

// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#pragma once

#include <Eigen/Dense>
#include <cstdint>

// Variable values are stored flat in row-major order, which is also
// the order NetCDF uses, so a variable of any rank is held in a
// single column array. Floating point data use Eigen::ArrayXd and
// integer data, including time stamps, use ArrayXl.
using ArrayXl = Eigen::Array<int64_t, Eigen::Dynamic, 1>;

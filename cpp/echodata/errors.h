// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Exceptions raised when records cannot be combined. All of them
// abort the combination without producing output.

#pragma once

#include <stdexcept>

namespace echomerge {

// Instrument models of the input records are missing or differ
class ValidationError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// The identical or no_conflicts attribute policy was violated
class AttributeConflictError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Datasets of one group cannot be joined into one, e.g. because the
// same variable has different dimensions in different records
class ConcatenationError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

} // namespace echomerge

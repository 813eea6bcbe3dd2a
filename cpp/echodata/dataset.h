// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Labeled multidimensional data: a dataset is a set of named
// dimensions, variables defined over those dimensions, and global
// attributes. This corresponds to one NetCDF group. The combination
// code only works through the Dataset and DatasetBackend interfaces
// and does not assume how the values are stored.

#pragma once

#include "attrs.h"

#include <common/eigen.h>
#include <memory>

namespace echomerge {

// On-disk type of a variable. Values are held as double, int64, or
// strings in memory but are written back with their original type.
enum class DType
{
    f32,
    f64,
    i8,
    u8,
    i16,
    u16,
    i32,
    u32,
    i64,
    u64,
    str,   // Variable length string
    chars, // Fixed width character array
    attrs, // Attribute collections, written as text
};

using Values = std::variant<Eigen::ArrayXd,
                            ArrayXl,
                            std::vector<std::string>,
                            std::vector<Attrs>>;

struct Variable
{
    // Names of the dimensions, slowest varying first
    std::vector<std::string> dims {};
    // Flat values in row-major order
    Values values {};
    Attrs attrs {};
    DType dtype { DType::f64 };
    // Maximum number of characters of a fixed width string
    // variable. Zero means no limit.
    size_t str_width {};

    [[nodiscard]] auto size() const -> size_t;
};

// Whether the values of two variables are equal. NaNs compare equal
// to each other.
[[nodiscard]] auto valuesEqual(const Values& lhs, const Values& rhs) -> bool;

// Dimension names and sizes in the order of definition
using Dims = std::vector<std::pair<std::string, size_t>>;

// Which variables without the concatenation dimension are joined
// when concatenating datasets
enum class VariableMode
{
    minimal,   // None, they are taken from the first dataset
    all,       // All of them
    different, // Only those that are not equal in all datasets
};

class Dataset
{
public:
    [[nodiscard]] virtual auto dims() const -> const Dims& = 0;
    [[nodiscard]] virtual auto hasDim(const std::string& name) const
      -> bool = 0;
    // Throws std::out_of_range for an unknown dimension
    [[nodiscard]] virtual auto dimSize(const std::string& name) const
      -> size_t = 0;
    // Adding an existing dimension with a different size is an error
    virtual auto addDim(const std::string& name, const size_t size)
      -> void = 0;
    // Remove a dimension together with all variables defined over it
    virtual auto dropDim(const std::string& name) -> void = 0;

    [[nodiscard]] virtual auto variableNames() const
      -> std::vector<std::string> = 0;
    [[nodiscard]] virtual auto hasVariable(const std::string& name) const
      -> bool = 0;
    // Throws std::out_of_range for an unknown variable
    [[nodiscard]] virtual auto variable(const std::string& name) const
      -> const Variable& = 0;
    // Add or replace a variable. All its dimensions must already be
    // defined and the number of values must match their sizes.
    virtual auto setVariable(const std::string& name, Variable var)
      -> void = 0;

    [[nodiscard]] virtual auto attrs() const -> const Attrs& = 0;
    virtual auto setAttrs(Attrs attrs) -> void = 0;

    // Deep copy that shares no storage with this dataset
    [[nodiscard]] virtual auto clone() const -> std::unique_ptr<Dataset> = 0;

    // Whether the dataset has a coordinate variable for dimension
    // name, i.e. a variable with the same name defined over that
    // dimension only.
    [[nodiscard]] auto hasCoord(const std::string& name) const -> bool;
    // Shape of a variable from the sizes of its dimensions
    [[nodiscard]] auto shape(const Variable& var) const -> std::vector<size_t>;

    virtual ~Dataset() = default;
};

// Creates datasets and joins several of them into one
class DatasetBackend
{
public:
    [[nodiscard]] virtual auto create() const -> std::unique_ptr<Dataset> = 0;
    // Join parts along the concatenation dimensions concat_dims. A
    // variable is joined along the first of those dimensions it
    // carries. Variables carrying none of them are handled according
    // to mode. If concat_dims is empty the parts are merged instead
    // (union of variables, first occurrence wins). Other dimensions
    // that differ in size are outer joined and shorter data are
    // padded with fill values. Global attributes of the result are
    // reduced with attrs_policy. The parts are not modified and the
    // result shares no storage with them. Throws ConcatenationError
    // if the parts are incompatible.
    [[nodiscard]] virtual auto concat(
      const std::vector<std::shared_ptr<const Dataset>>& parts,
      const std::vector<std::string>& concat_dims,
      const VariableMode mode,
      const CombineAttrs attrs_policy) const -> std::unique_ptr<Dataset> = 0;
    virtual ~DatasetBackend() = default;
};

// Dataset with all values held in memory
class MemoryDataset : public Dataset
{
private:
    Dims dimensions {};
    std::vector<std::pair<std::string, Variable>> variables {};
    Attrs global_attrs {};

public:
    MemoryDataset() = default;
    [[nodiscard]] auto dims() const -> const Dims& override
    {
        return dimensions;
    }
    [[nodiscard]] auto hasDim(const std::string& name) const -> bool override;
    [[nodiscard]] auto dimSize(const std::string& name) const
      -> size_t override;
    auto addDim(const std::string& name, const size_t size) -> void override;
    auto dropDim(const std::string& name) -> void override;
    [[nodiscard]] auto variableNames() const
      -> std::vector<std::string> override;
    [[nodiscard]] auto hasVariable(const std::string& name) const
      -> bool override;
    [[nodiscard]] auto variable(const std::string& name) const
      -> const Variable& override;
    auto setVariable(const std::string& name, Variable var) -> void override;
    [[nodiscard]] auto attrs() const -> const Attrs& override
    {
        return global_attrs;
    }
    auto setAttrs(Attrs attrs) -> void override
    {
        global_attrs = std::move(attrs);
    }
    [[nodiscard]] auto clone() const -> std::unique_ptr<Dataset> override;
};

class MemoryBackend : public DatasetBackend
{
public:
    [[nodiscard]] auto create() const -> std::unique_ptr<Dataset> override;
    [[nodiscard]] auto concat(
      const std::vector<std::shared_ptr<const Dataset>>& parts,
      const std::vector<std::string>& concat_dims,
      const VariableMode mode,
      const CombineAttrs attrs_policy) const
      -> std::unique_ptr<Dataset> override;
};

// Backend used when none is specified
[[nodiscard]] auto memoryBackend() -> const DatasetBackend&;

} // namespace echomerge

// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "dataset.h"

#include "errors.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <netcdf.h>
#include <numeric>

namespace echomerge {

using Shape = std::vector<size_t>;

auto Variable::size() const -> size_t
{
    return std::visit(
      [](const auto& vals) { return static_cast<size_t>(vals.size()); },
      values);
}

auto valuesEqual(const Values& lhs, const Values& rhs) -> bool
{
    if (lhs.index() != rhs.index()) {
        return false;
    }
    return std::visit(
      [&rhs](const auto& a) -> bool {
          using T = std::decay_t<decltype(a)>;
          const auto& b { std::get<T>(rhs) };
          if (a.size() != b.size()) {
              return false;
          }
          if constexpr (std::is_same_v<T, Eigen::ArrayXd>) {
              return ((a == b) || (a.isNaN() && b.isNaN())).all();
          } else if constexpr (std::is_same_v<T, ArrayXl>) {
              return (a == b).all();
          } else {
              return a == b;
          }
      },
      lhs);
}

auto Dataset::hasCoord(const std::string& name) const -> bool
{
    if (!hasVariable(name)) {
        return false;
    }
    const auto& dims { variable(name).dims };
    return dims.size() == 1 && dims.front() == name;
}

auto Dataset::shape(const Variable& var) const -> std::vector<size_t>
{
    std::vector<size_t> var_shape {};
    for (const auto& dim : var.dims) {
        var_shape.push_back(dimSize(dim));
    }
    return var_shape;
}

auto MemoryDataset::hasDim(const std::string& name) const -> bool
{
    return std::ranges::any_of(
      dimensions, [&name](const auto& dim) { return dim.first == name; });
}

auto MemoryDataset::dimSize(const std::string& name) const -> size_t
{
    const auto it { std::ranges::find_if(
      dimensions, [&name](const auto& dim) { return dim.first == name; }) };
    if (it == dimensions.end()) {
        throw std::out_of_range { "dimension not found: " + name };
    }
    return it->second;
}

auto MemoryDataset::addDim(const std::string& name, const size_t size) -> void
{
    if (hasDim(name)) {
        if (dimSize(name) != size) {
            throw std::invalid_argument { "dimension " + name
                                          + " already defined with size "
                                          + std::to_string(dimSize(name)) };
        }
        return;
    }
    dimensions.emplace_back(name, size);
}

auto MemoryDataset::dropDim(const std::string& name) -> void
{
    std::erase_if(dimensions,
                  [&name](const auto& dim) { return dim.first == name; });
    std::erase_if(variables, [&name](const auto& var) {
        return std::ranges::find(var.second.dims, name)
               != var.second.dims.end();
    });
}

auto MemoryDataset::variableNames() const -> std::vector<std::string>
{
    std::vector<std::string> names {};
    names.reserve(variables.size());
    for (const auto& var : variables) {
        names.push_back(var.first);
    }
    return names;
}

auto MemoryDataset::hasVariable(const std::string& name) const -> bool
{
    return std::ranges::any_of(
      variables, [&name](const auto& var) { return var.first == name; });
}

auto MemoryDataset::variable(const std::string& name) const -> const Variable&
{
    const auto it { std::ranges::find_if(
      variables, [&name](const auto& var) { return var.first == name; }) };
    if (it == variables.end()) {
        throw std::out_of_range { "variable not found: " + name };
    }
    return it->second;
}

auto MemoryDataset::setVariable(const std::string& name, Variable var) -> void
{
    size_t n_values { 1 };
    for (const auto& dim : var.dims) {
        if (!hasDim(dim)) {
            throw std::invalid_argument { "variable " + name
                                          + " uses undefined dimension "
                                          + dim };
        }
        n_values *= dimSize(dim);
    }
    if (var.size() != n_values) {
        throw std::invalid_argument {
            "variable " + name + " has " + std::to_string(var.size())
            + " values but its dimensions require "
            + std::to_string(n_values)
        };
    }
    const auto it { std::ranges::find_if(
      variables, [&name](const auto& item) { return item.first == name; }) };
    if (it == variables.end()) {
        variables.emplace_back(name, std::move(var));
    } else {
        it->second = std::move(var);
    }
}

auto MemoryDataset::clone() const -> std::unique_ptr<Dataset>
{
    return std::make_unique<MemoryDataset>(*this);
}

static auto product(const Shape& shape) -> size_t
{
    return std::accumulate(
      shape.begin(), shape.end(), size_t { 1 }, std::multiplies<> {});
}

// Default fill value of an integer variable of a given type. These
// are the netCDF defaults.
static auto defaultFill(const DType dtype) -> int64_t
{
    switch (dtype) {
    case DType::i8:
        return NC_FILL_BYTE;
    case DType::u8:
        return NC_FILL_UBYTE;
    case DType::i16:
        return NC_FILL_SHORT;
    case DType::u16:
        return NC_FILL_USHORT;
    case DType::u32:
        return NC_FILL_UINT;
    case DType::i64:
        return NC_FILL_INT64;
    case DType::u64:
        // NC_FILL_UINT64 is out of range of int64
        return std::numeric_limits<int64_t>::max();
    case DType::i32:
    case DType::f32:
    case DType::f64:
    case DType::str:
    case DType::chars:
    case DType::attrs:
        return NC_FILL_INT;
    }
    return NC_FILL_INT;
}

// Values of the same kind as those of var, of length n, set to the
// _FillValue of var or otherwise the default fill value of its type
static auto filledValues(const Variable& var, const size_t n) -> Values
{
    const AttrValue* fill_value { var.attrs.contains("_FillValue")
                                    ? &var.attrs.at("_FillValue")
                                    : nullptr };
    return std::visit(
      [&var, fill_value, n](const auto& vals) -> Values {
          using T = std::decay_t<decltype(vals)>;
          const auto size { static_cast<Eigen::Index>(n) };
          if constexpr (std::is_same_v<T, Eigen::ArrayXd>) {
              double value { std::numeric_limits<double>::quiet_NaN() };
              if (fill_value != nullptr) {
                  if (const auto* d { std::get_if<double>(fill_value) }) {
                      value = *d;
                  } else if (const auto* l { std::get_if<int64_t>(
                               fill_value) }) {
                      value = static_cast<double>(*l);
                  }
              }
              return Eigen::ArrayXd { Eigen::ArrayXd::Constant(size, value) };
          } else if constexpr (std::is_same_v<T, ArrayXl>) {
              int64_t value { defaultFill(var.dtype) };
              if (fill_value != nullptr) {
                  if (const auto* l { std::get_if<int64_t>(fill_value) }) {
                      value = *l;
                  } else if (const auto* d { std::get_if<double>(
                               fill_value) }) {
                      value = static_cast<int64_t>(*d);
                  }
              }
              return ArrayXl { ArrayXl::Constant(size, value) };
          } else {
              return T(n);
          }
      },
      var.values);
}

// Repeat the values count times, corresponding to a new leading
// dimension of size count
static auto repeatValues(const Values& values, const size_t count) -> Values
{
    return std::visit(
      [count](const auto& vals) -> Values {
          using T = std::decay_t<decltype(vals)>;
          if constexpr (std::is_same_v<T, Eigen::ArrayXd>
                        || std::is_same_v<T, ArrayXl>) {
              return T { vals.replicate(static_cast<Eigen::Index>(count),
                                        1) };
          } else {
              T repeated {};
              repeated.reserve(vals.size() * count);
              for (size_t i {}; i < count; ++i) {
                  repeated.insert(repeated.end(), vals.begin(), vals.end());
              }
              return repeated;
          }
      },
      values);
}

namespace {

// Where the indices of one axis of a part land in the result. Indices
// are either shifted by offset or, along an axis whose labels were
// aligned, looked up in positions.
struct AxisMap
{
    size_t offset {};
    const std::vector<size_t>* positions {};

    [[nodiscard]] auto operator()(const size_t i) const -> size_t
    {
        return positions == nullptr ? offset + i : (*positions)[i];
    }
};

} // namespace

// Copy src with shape src_shape into dst with shape dst_shape. Each
// axis of src is mapped into dst by the corresponding entry of axes.
static auto copyBlock(const Values& src,
                      const Shape& src_shape,
                      Values& dst,
                      const Shape& dst_shape,
                      const std::vector<AxisMap>& axes) -> void
{
    std::visit(
      [&](const auto& src_vals) {
          using T = std::decay_t<decltype(src_vals)>;
          auto& dst_vals { std::get<T>(dst) };
          const size_t rank { src_shape.size() };
          std::vector<size_t> idx(rank, 0);
          const size_t n { product(src_shape) };
          for (size_t i {}; i < n; ++i) {
              size_t j {};
              for (size_t k {}; k < rank; ++k) {
                  j = j * dst_shape[k] + axes[k](idx[k]);
              }
              dst_vals[j] = src_vals[i];
              // Next multi-index, last axis varies fastest
              for (size_t k { rank }; k-- > 0;) {
                  if (++idx[k] < src_shape[k]) {
                      break;
                  }
                  idx[k] = 0;
              }
          }
      },
      src);
}

template <typename L>
static auto sameLabel(const L& lhs, const L& rhs) -> bool
{
    if constexpr (std::is_same_v<L, double>) {
        return lhs == rhs || (std::isnan(lhs) && std::isnan(rhs));
    } else {
        return lhs == rhs;
    }
}

namespace {

// A dimension other than the concatenation dimensions that has a
// coordinate. The parts are joined on the labels of the coordinate.
struct Alignment
{
    // Union of the labels of all parts, in order of appearance
    Variable coord {};
    // For each part, the position of each of its labels in coord.
    // Empty if the part does not have the dimension.
    std::vector<std::vector<size_t>> positions {};
};

// Context of one concatenation: the parts, the dimensions being
// joined, and the result under construction.
struct ConcatContext
{
    const std::vector<std::shared_ptr<const Dataset>>& parts;
    // Concatenation dimensions present in at least one part
    std::vector<std::string> present_dims {};
    // Concatenation dimension that none of the parts has. It is
    // introduced with length one per part.
    std::string new_dim {};
    MemoryDataset& result;
    std::map<std::string, Alignment> aligned {};

    [[nodiscard]] auto isConcatDim(const std::string& dim) const -> bool
    {
        return std::ranges::find(present_dims, dim) != present_dims.end();
    }
    // Extent of a part along a dimension
    [[nodiscard]] auto extent(const Dataset& part,
                              const std::string& dim) const -> size_t
    {
        if (dim == new_dim) {
            return 1;
        }
        return part.hasDim(dim) ? part.dimSize(dim) : 0;
    }
    // How the axes of a variable of a part map into the result
    [[nodiscard]] auto axisMaps(const size_t i_part,
                                const std::vector<std::string>& dims) const
      -> std::vector<AxisMap>
    {
        std::vector<AxisMap> axes(dims.size());
        for (size_t k {}; k < dims.size(); ++k) {
            const auto it { aligned.find(dims[k]) };
            if (it != aligned.end()) {
                axes[k].positions = &it->second.positions[i_part];
            }
        }
        return axes;
    }
};

} // namespace

// Union of the labels of the coordinate of dim over all parts. A part
// that has the dimension but not the coordinate is taken to follow
// the order of the union.
static auto alignDim(const ConcatContext& ctx, const std::string& dim)
  -> Alignment
{
    const auto first_part { std::ranges::find_if(
      ctx.parts, [&dim](const auto& part) { return part->hasCoord(dim); }) };
    const Variable& first { (*first_part)->variable(dim) };
    Alignment alignment {};
    alignment.coord = first;
    alignment.coord.values = std::visit(
      [&](const auto& first_labels) -> Values {
          using T = std::decay_t<decltype(first_labels)>;
          using L = typename T::value_type;
          std::vector<L> labels {};
          for (const auto& part : ctx.parts) {
              std::vector<size_t> positions {};
              if (part->hasCoord(dim)) {
                  const Variable& coord { part->variable(dim) };
                  if (coord.values.index() != first.values.index()) {
                      throw ConcatenationError {
                          "coordinate " + dim
                          + " has different value types in different datasets"
                      };
                  }
                  alignment.coord.str_width =
                    std::max(alignment.coord.str_width, coord.str_width);
                  const auto& part_labels { std::get<T>(coord.values) };
                  for (size_t i {}; i < static_cast<size_t>(part_labels.size());
                       ++i) {
                      const L& label { part_labels[i] };
                      const auto it { std::ranges::find_if(
                        labels, [&label](const L& other) {
                            return sameLabel(other, label);
                        }) };
                      const auto pos { static_cast<size_t>(
                        std::distance(labels.begin(), it)) };
                      if (std::ranges::find(positions, pos)
                          != positions.end()) {
                          throw ConcatenationError {
                              "coordinate " + dim + " has duplicate values"
                          };
                      }
                      if (it == labels.end()) {
                          labels.push_back(label);
                      }
                      positions.push_back(pos);
                  }
              } else if (part->hasDim(dim)) {
                  positions.resize(part->dimSize(dim));
                  std::iota(positions.begin(), positions.end(), size_t { 0 });
              }
              alignment.positions.push_back(std::move(positions));
          }
          T union_labels {};
          union_labels.resize(labels.size());
          for (size_t i {}; i < labels.size(); ++i) {
              union_labels[i] = labels[i];
          }
          return union_labels;
      },
      first.values);
    const size_t n_labels { alignment.coord.size() };
    for (size_t i {}; i < ctx.parts.size(); ++i) {
        if (ctx.parts[i]->hasDim(dim) && !ctx.parts[i]->hasCoord(dim)
            && ctx.parts[i]->dimSize(dim) != n_labels) {
            throw ConcatenationError {
                "dimension " + dim + " has no coordinate in one dataset and "
                + std::to_string(ctx.parts[i]->dimSize(dim))
                + " entries instead of " + std::to_string(n_labels)
            };
        }
    }
    return alignment;
}

// Define the dimensions of the result. Concatenation dimensions are
// the sum of the extents of the parts. Other dimensions with a
// coordinate are the union of its labels, the remaining ones the
// largest extent found (outer join).
static auto concatDims(ConcatContext& ctx) -> void
{
    if (!ctx.new_dim.empty()) {
        ctx.result.addDim(ctx.new_dim, ctx.parts.size());
    }
    for (const auto& part : ctx.parts) {
        for (const auto& [name, size] : part->dims()) {
            if (ctx.result.hasDim(name)) {
                continue;
            }
            const bool has_coord { std::ranges::any_of(
              ctx.parts,
              [&name](const auto& other) { return other->hasCoord(name); }) };
            if (!ctx.isConcatDim(name) && has_coord) {
                auto alignment { alignDim(ctx, name) };
                ctx.result.addDim(name, alignment.coord.size());
                ctx.aligned.emplace(name, std::move(alignment));
                continue;
            }
            size_t total {};
            for (const auto& other : ctx.parts) {
                if (ctx.isConcatDim(name)) {
                    total += ctx.extent(*other, name);
                } else {
                    total = std::max(total, ctx.extent(*other, name));
                }
            }
            ctx.result.addDim(name, total);
        }
    }
}

// Variable of the result taken from a single part, padded to the
// result dimensions and placed on the aligned labels where needed
static auto takeVariable(const ConcatContext& ctx,
                         const size_t i_part,
                         const Variable& var,
                         const size_t str_width) -> Variable
{
    Variable out { var };
    out.str_width = str_width;
    const Shape src_shape { ctx.parts[i_part]->shape(var) };
    const Shape dst_shape { ctx.result.shape(var) };
    const auto axes { ctx.axisMaps(i_part, var.dims) };
    const bool aligned { std::ranges::any_of(
      axes, [](const AxisMap& axis) { return axis.positions != nullptr; }) };
    if (src_shape != dst_shape || aligned) {
        out.values = filledValues(var, product(dst_shape));
        copyBlock(var.values, src_shape, out.values, dst_shape, axes);
    }
    return out;
}

// Variable of the result joined from all parts along join_dim. If
// expand is true, the variable does not carry join_dim in the parts
// and is broadcast along it first. Parts without the variable leave
// fill values in their block.
static auto joinVariable(const ConcatContext& ctx,
                         const std::string& name,
                         const Variable& first,
                         const std::string& join_dim,
                         const bool expand,
                         const size_t str_width) -> Variable
{
    Variable out {};
    out.dims = first.dims;
    if (expand) {
        out.dims.insert(out.dims.begin(), join_dim);
    }
    out.attrs = first.attrs;
    out.dtype = first.dtype;
    out.str_width = str_width;
    const Shape dst_shape { ctx.result.shape(out) };
    out.values = filledValues(first, product(dst_shape));
    const auto axis { static_cast<size_t>(std::distance(
      out.dims.begin(), std::ranges::find(out.dims, join_dim))) };
    size_t offset {};
    for (size_t i {}; i < ctx.parts.size(); ++i) {
        const Dataset& part { *ctx.parts[i] };
        const size_t extent { ctx.extent(part, join_dim) };
        if (part.hasVariable(name) && extent > 0) {
            const Variable& var { part.variable(name) };
            Shape src_shape { part.shape(var) };
            auto axes { ctx.axisMaps(i, out.dims) };
            axes[axis].offset = offset;
            if (expand) {
                src_shape.insert(src_shape.begin(), extent);
                copyBlock(repeatValues(var.values, extent),
                          src_shape,
                          out.values,
                          dst_shape,
                          axes);
            } else {
                copyBlock(var.values, src_shape, out.values, dst_shape, axes);
            }
        }
        offset += extent;
    }
    return out;
}

static auto concatVariable(const ConcatContext& ctx,
                           const std::string& name,
                           const VariableMode mode) -> void
{
    if (const auto it { ctx.aligned.find(name) }; it != ctx.aligned.end()) {
        ctx.result.setVariable(name, it->second.coord);
        return;
    }
    // Parts holding the variable must agree on its dimensions and kind
    std::vector<size_t> holders {};
    for (size_t i {}; i < ctx.parts.size(); ++i) {
        if (ctx.parts[i]->hasVariable(name)) {
            holders.push_back(i);
        }
    }
    const Dataset& first_part { *ctx.parts[holders.front()] };
    const Variable& first { first_part.variable(name) };
    size_t str_width {};
    bool all_equal { holders.size() == ctx.parts.size() };
    for (const size_t i : holders) {
        const Dataset& holder { *ctx.parts[i] };
        const Variable& var { holder.variable(name) };
        if (var.dims != first.dims) {
            throw ConcatenationError {
                "variable " + name
                + " has different dimensions in different datasets"
            };
        }
        if (var.values.index() != first.values.index()) {
            throw ConcatenationError {
                "variable " + name
                + " has different value types in different datasets"
            };
        }
        str_width = std::max(str_width, var.str_width);
        all_equal = all_equal
                    && holder.shape(var) == first_part.shape(first)
                    && valuesEqual(var.values, first.values);
    }

    // Join along the first concatenation dimension the variable carries
    for (const auto& dim : ctx.present_dims) {
        if (std::ranges::find(first.dims, dim) != first.dims.end()) {
            ctx.result.setVariable(
              name, joinVariable(ctx, name, first, dim, false, str_width));
            return;
        }
    }
    if (!ctx.present_dims.empty()) {
        const bool broadcast { !ctx.new_dim.empty() || mode == VariableMode::all
                               || (mode == VariableMode::different
                                   && !all_equal) };
        if (broadcast) {
            ctx.result.setVariable(
              name,
              joinVariable(
                ctx, name, first, ctx.present_dims.front(), true, str_width));
            return;
        }
    }
    // Otherwise from the first part holding it
    ctx.result.setVariable(
      name, takeVariable(ctx, holders.front(), first, str_width));
}

auto MemoryBackend::create() const -> std::unique_ptr<Dataset>
{
    return std::make_unique<MemoryDataset>();
}

auto MemoryBackend::concat(
  const std::vector<std::shared_ptr<const Dataset>>& parts,
  const std::vector<std::string>& concat_dims,
  const VariableMode mode,
  const CombineAttrs attrs_policy) const -> std::unique_ptr<Dataset>
{
    if (parts.empty()) {
        throw std::invalid_argument { "no datasets to concatenate" };
    }
    auto result { std::make_unique<MemoryDataset>() };
    ConcatContext ctx { parts, {}, {}, *result };
    for (const auto& dim : concat_dims) {
        if (std::ranges::any_of(parts, [&dim](const auto& part) {
                return part->hasDim(dim);
            })) {
            ctx.present_dims.push_back(dim);
        }
    }
    if (ctx.present_dims.empty() && !concat_dims.empty()) {
        ctx.new_dim = concat_dims.front();
        ctx.present_dims.push_back(ctx.new_dim);
    }
    concatDims(ctx);

    std::vector<std::string> names {};
    for (const auto& part : parts) {
        for (const auto& name : part->variableNames()) {
            if (std::ranges::find(names, name) == names.end()) {
                names.push_back(name);
            }
        }
    }
    for (const auto& name : names) {
        concatVariable(ctx, name, mode);
    }

    std::vector<Attrs> attrs_list {};
    attrs_list.reserve(parts.size());
    for (const auto& part : parts) {
        attrs_list.push_back(part->attrs());
    }
    result->setAttrs(mergeAttrs(attrs_list, attrs_policy));
    return result;
}

auto memoryBackend() -> const DatasetBackend&
{
    static const MemoryBackend backend {};
    return backend;
}

} // namespace echomerge

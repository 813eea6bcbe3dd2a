// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "record_io.h"

#include <algorithm>
#include <array>
#include <cmath>
#include <common/io.h>
#include <cstring>
#include <map>
#include <netcdf>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace echomerge {

// Length of one unit of time [ns], for decoding time units
static const std::map<std::string, int64_t> time_units {
    { "nanoseconds", 1 },
    { "microseconds", timing::ns_per_us },
    { "milliseconds", timing::ns_per_ms },
    { "seconds", timing::ns_per_s },
    { "minutes", timing::ns_per_min },
    { "hours", timing::ns_per_hour },
    { "days", timing::ns_per_day },
};

static auto dtypeFromNc(const nc_type type) -> DType
{
    switch (type) {
    case NC_FLOAT:
        return DType::f32;
    case NC_DOUBLE:
        return DType::f64;
    case NC_BYTE:
        return DType::i8;
    case NC_UBYTE:
        return DType::u8;
    case NC_SHORT:
        return DType::i16;
    case NC_USHORT:
        return DType::u16;
    case NC_INT:
        return DType::i32;
    case NC_UINT:
        return DType::u32;
    case NC_INT64:
        return DType::i64;
    case NC_UINT64:
        return DType::u64;
    case NC_STRING:
        return DType::str;
    case NC_CHAR:
        return DType::chars;
    default:
        throw std::runtime_error { "unsupported NetCDF type: "
                                   + std::to_string(type) };
    }
}

static auto ncType(const DType dtype) -> netCDF::NcType
{
    switch (dtype) {
    case DType::f32:
        return netCDF::ncFloat;
    case DType::f64:
        return netCDF::ncDouble;
    case DType::i8:
        return netCDF::ncByte;
    case DType::u8:
        return netCDF::ncUbyte;
    case DType::i16:
        return netCDF::ncShort;
    case DType::u16:
        return netCDF::ncUshort;
    case DType::i32:
        return netCDF::ncInt;
    case DType::u32:
        return netCDF::ncUint;
    case DType::i64:
        return netCDF::ncInt64;
    case DType::u64:
        return netCDF::ncUint64;
    case DType::str:
    case DType::attrs:
        return netCDF::ncString;
    case DType::chars:
        return netCDF::ncChar;
    }
    return netCDF::ncDouble;
}

// Dimensions or variables of a group in the order of definition
template <typename T>
static auto byId(const std::multimap<std::string, T>& items)
  -> std::vector<T>
{
    std::vector<T> sorted {};
    for (const auto& [name, item] : items) {
        sorted.push_back(item);
    }
    std::ranges::sort(
      sorted, {}, [](const T& item) { return item.getId(); });
    return sorted;
}

static auto attrValue(const netCDF::NcAtt& att) -> AttrValue
{
    const size_t len { att.getAttLength() };
    switch (att.getType().getId()) {
    case NC_CHAR: {
        std::string value {};
        att.getValues(value);
        // Some writers include the terminating null character
        value.resize(strnlen(value.c_str(), value.size()));
        return value;
    }
    case NC_STRING: {
        std::vector<char*> buf(len);
        att.getValues(buf.data());
        std::string value { len > 0 && buf.front() != nullptr ? buf.front()
                                                              : "" };
        netCDF::ncCheck(nc_free_string(len, buf.data()), __FILE__, __LINE__);
        return value;
    }
    case NC_FLOAT:
    case NC_DOUBLE: {
        std::vector<double> values(len);
        att.getValues(values.data());
        if (len == 1) {
            return values.front();
        }
        return values;
    }
    default: {
        if (len == 1) {
            long long value {};
            att.getValues(&value);
            return static_cast<int64_t>(value);
        }
        std::vector<double> values(len);
        att.getValues(values.data());
        return values;
    }
    }
}

// Attributes of a variable or of a group (varid = NC_GLOBAL) in the
// order of definition
template <typename T>
static auto readAttrs(const T& nc_obj, const int ncid, const int varid)
  -> Attrs
{
    int n_atts {};
    netCDF::ncCheck(nc_inq_varnatts(ncid, varid, &n_atts), __FILE__, __LINE__);
    Attrs attrs {};
    for (int i {}; i < n_atts; ++i) {
        std::array<char, NC_MAX_NAME + 1> name {};
        netCDF::ncCheck(
          nc_inq_attname(ncid, varid, i, name.data()), __FILE__, __LINE__);
        attrs.set(name.data(), attrValue(nc_obj.getAtt(name.data())));
    }
    return attrs;
}

template <typename T>
static auto putAttrs(T& nc_obj,
                     const Attrs& attrs,
                     const netCDF::NcType& fill_type = netCDF::ncDouble)
  -> void
{
    for (const auto& [key, value] : attrs) {
        // The fill value must have the type of its variable
        const bool is_fill { key == "_FillValue" };
        if (const auto* str { std::get_if<std::string>(&value) }) {
            nc_obj.putAtt(key, *str);
        } else if (const auto* i { std::get_if<int64_t>(&value) }) {
            nc_obj.putAtt(key, is_fill ? fill_type : netCDF::ncInt64, *i);
        } else if (const auto* d { std::get_if<double>(&value) }) {
            nc_obj.putAtt(key, is_fill ? fill_type : netCDF::ncDouble, *d);
        } else {
            const auto& list { std::get<std::vector<double>>(value) };
            nc_obj.putAtt(key, netCDF::ncDouble, list.size(), list.data());
        }
    }
}

// Attribute collections are stored as one-line YAML mappings. Text is
// quoted so it is not mistaken for a number when read back.
static auto encodeAttrs(const Attrs& attrs) -> std::string
{
    YAML::Emitter out {};
    out << YAML::Flow << YAML::BeginMap;
    for (const auto& [key, value] : attrs) {
        out << YAML::Key << key << YAML::Value;
        if (const auto* str { std::get_if<std::string>(&value) }) {
            out << YAML::DoubleQuoted << *str;
        } else if (const auto* i { std::get_if<int64_t>(&value) }) {
            out << *i;
        } else if (const auto* d { std::get_if<double>(&value) }) {
            out << *d;
        } else {
            out << YAML::Flow << std::get<std::vector<double>>(value);
        }
    }
    out << YAML::EndMap;
    return out.c_str();
}

static auto decodeAttrs(const std::string& text) -> Attrs
{
    Attrs attrs {};
    for (const auto& item : YAML::Load(text)) {
        const auto key { item.first.as<std::string>() };
        const YAML::Node& node { item.second };
        int64_t i {};
        double d {};
        if (node.IsSequence()) {
            attrs.set(key, node.as<std::vector<double>>());
        } else if (node.Tag() == "!") {
            // Quoted scalar
            attrs.set(key, node.as<std::string>());
        } else if (YAML::convert<int64_t>::decode(node, i)) {
            attrs.set(key, i);
        } else if (YAML::convert<double>::decode(node, d)) {
            attrs.set(key, d);
        } else {
            attrs.set(key, node.as<std::string>());
        }
    }
    return attrs;
}

// Whether a variable holds attribute collections, i.e. it is named
// <group>_attrs and defined over <group>_file.
static auto isAttrsVariable(const std::string& name,
                            const std::vector<std::string>& dims) -> bool
{
    const std::string suffix { "_attrs" };
    if (name.size() <= suffix.size() || !name.ends_with(suffix)) {
        return false;
    }
    const std::string prefix { name.substr(0, name.size() - suffix.size()) };
    return dims.size() == 1 && dims.front() == prefix + "_file";
}

// Convert a time variable with units "<unit> since <epoch>" to
// integer nanoseconds. Other variables are left as they are.
static auto decodeTime(Variable& var) -> void
{
    if (!var.attrs.contains("units")) {
        return;
    }
    const auto* units { std::get_if<std::string>(&var.attrs.at("units")) };
    if (units == nullptr) {
        return;
    }
    const auto pos { units->find(" since ") };
    if (pos == std::string::npos) {
        return;
    }
    const auto unit { time_units.find(units->substr(0, pos)) };
    if (unit == time_units.end()) {
        return;
    }
    const int64_t ns_per_unit { unit->second };
    const std::string since { units->substr(pos) };
    ArrayXl time {};
    if (const auto* values { std::get_if<Eigen::ArrayXd>(&var.values) }) {
        time.resize(values->size());
        for (Eigen::Index i {}; i < values->size(); ++i) {
            const double value { (*values)(i) };
            time(i) = std::isnan(value) ? fill::i
                                        : static_cast<int64_t>(std::llround(
                                            value * ns_per_unit));
        }
    } else if (const auto* values { std::get_if<ArrayXl>(&var.values) }) {
        time = *values * ns_per_unit;
    } else {
        return;
    }
    var.values = std::move(time);
    var.dtype = DType::i64;
    var.attrs.set("units", "nanoseconds" + since);
    var.attrs.erase("_FillValue");
}

static auto readVariable(const netCDF::NcVar& nc_var, Dataset& dataset)
  -> void
{
    const std::string name { nc_var.getName() };
    const nc_type type { nc_var.getType().getId() };
    Variable var {};
    var.dtype = dtypeFromNc(type);
    std::vector<netCDF::NcDim> nc_dims { nc_var.getDims() };
    // The last dimension of a character array is the string length
    size_t width { 1 };
    if (type == NC_CHAR && !nc_dims.empty()) {
        width = nc_dims.back().getSize();
        nc_dims.pop_back();
        var.str_width = width;
    }
    size_t n_values { 1 };
    for (const auto& nc_dim : nc_dims) {
        // Dimensions may be defined in a parent group
        dataset.addDim(nc_dim.getName(), nc_dim.getSize());
        var.dims.push_back(nc_dim.getName());
        n_values *= nc_dim.getSize();
    }
    var.attrs =
      readAttrs(nc_var, nc_var.getParentGroup().getId(), nc_var.getId());

    switch (type) {
    case NC_FLOAT:
    case NC_DOUBLE: {
        Eigen::ArrayXd values(static_cast<Eigen::Index>(n_values));
        if (n_values > 0) {
            nc_var.getVar(values.data());
        }
        var.values = std::move(values);
        break;
    }
    case NC_CHAR: {
        std::vector<char> buf(n_values * width);
        if (!buf.empty()) {
            nc_var.getVar(buf.data());
        }
        std::vector<std::string> strings {};
        for (size_t i {}; i < n_values; ++i) {
            const char* begin { buf.data() + i * width };
            strings.emplace_back(begin, strnlen(begin, width));
        }
        var.values = std::move(strings);
        break;
    }
    case NC_STRING: {
        std::vector<char*> buf(n_values);
        if (n_values > 0) {
            nc_var.getVar(buf.data());
        }
        std::vector<std::string> strings {};
        for (const char* str : buf) {
            strings.emplace_back(str == nullptr ? "" : str);
        }
        if (n_values > 0) {
            netCDF::ncCheck(
              nc_free_string(n_values, buf.data()), __FILE__, __LINE__);
        }
        if (isAttrsVariable(name, var.dims)) {
            std::vector<Attrs> attrs_list {};
            for (const auto& str : strings) {
                attrs_list.push_back(decodeAttrs(str));
            }
            var.values = std::move(attrs_list);
            var.dtype = DType::attrs;
        } else {
            var.values = std::move(strings);
        }
        break;
    }
    default: {
        ArrayXl values(static_cast<Eigen::Index>(n_values));
        if (n_values > 0) {
            nc_var.getVar(values.data());
        }
        var.values = std::move(values);
        break;
    }
    }
    decodeTime(var);
    dataset.setVariable(name, std::move(var));
}

static auto readDataset(const netCDF::NcGroup& nc_grp)
  -> std::unique_ptr<Dataset>
{
    auto dataset { memoryBackend().create() };
    const auto nc_vars { byId(nc_grp.getVars()) };
    // String length dimensions of character arrays are not part of
    // the dataset.
    std::vector<std::string> char_dims {};
    for (const auto& nc_var : nc_vars) {
        if (nc_var.getType().getId() == NC_CHAR && nc_var.getDimCount() > 0) {
            char_dims.push_back(nc_var.getDims().back().getName());
        }
    }
    for (const auto& nc_dim : byId(nc_grp.getDims())) {
        if (std::ranges::find(char_dims, nc_dim.getName()) == char_dims.end()) {
            dataset->addDim(nc_dim.getName(), nc_dim.getSize());
        }
    }
    for (const auto& nc_var : nc_vars) {
        readVariable(nc_var, *dataset);
    }
    dataset->setAttrs(readAttrs(nc_grp, nc_grp.getId(), NC_GLOBAL));
    return dataset;
}

auto readRecord(const std::string& filename) -> EchoData
{
    spdlog::info("Reading {}", filename);
    const netCDF::NcFile nc { filename, netCDF::NcFile::read };
    EchoData record {};
    record.converted_raw_path = filename;
    for (const Group group : groupMap()) {
        netCDF::NcGroup nc_grp { nc };
        for (const auto& name : splitString(groupPath(group), '/')) {
            nc_grp = nc_grp.getGroup(name);
            if (nc_grp.isNull()) {
                break;
            }
        }
        if (nc_grp.isNull()) {
            spdlog::debug("{}: no group {}", filename, groupName(group));
            continue;
        }
        record.setGroup(group, readDataset(nc_grp));
    }

    const auto& top { record.group(Group::top) };
    if (!top->attrs().contains("keywords")) {
        spdlog::warn("{}: sonar model not specified", filename);
        return record;
    }
    const auto& keywords { top->attrs().at("keywords") };
    try {
        record.sonar_model =
          sonarModelFromString(std::get<std::string>(keywords));
    } catch (const std::exception&) {
        spdlog::warn("{}: unknown sonar model {}",
                     filename,
                     attrValueToString(keywords));
    }
    return record;
}

static auto writeVariable(netCDF::NcGroup& nc_grp,
                          const std::string& name,
                          const Variable& var,
                          const bool compress) -> void
{
    const netCDF::NcType type { ncType(var.dtype) };
    std::vector<netCDF::NcDim> nc_dims {};
    for (const auto& dim : var.dims) {
        nc_dims.push_back(nc_grp.getDim(dim));
    }
    const size_t n_values { var.size() };

    if (const auto* strings {
          std::get_if<std::vector<std::string>>(&var.values) }) {
        Attrs attrs { var.attrs };
        attrs.erase("_FillValue");
        if (var.dtype == DType::chars) {
            size_t width { var.str_width };
            if (width == 0) {
                width = 1;
                for (const auto& str : *strings) {
                    width = std::max(width, str.size());
                }
            }
            const std::string dim_name { "string" + std::to_string(width) };
            netCDF::NcDim nc_len { nc_grp.getDim(dim_name,
                                                 netCDF::NcGroup::Current) };
            if (nc_len.isNull()) {
                nc_len = nc_grp.addDim(dim_name, width);
            }
            nc_dims.push_back(nc_len);
            auto nc_var { nc_grp.addVar(name, netCDF::ncChar, nc_dims) };
            putAttrs(nc_var, attrs);
            std::vector<char> buf(n_values * width, '\0');
            for (size_t i {}; i < n_values; ++i) {
                const auto& str { (*strings)[i] };
                std::copy_n(
                  str.begin(), std::min(width, str.size()), &buf[i * width]);
            }
            if (!buf.empty()) {
                nc_var.putVar(buf.data());
            }
        } else {
            auto nc_var { nc_grp.addVar(name, netCDF::ncString, nc_dims) };
            putAttrs(nc_var, attrs);
            std::vector<const char*> buf {};
            for (const auto& str : *strings) {
                buf.push_back(str.c_str());
            }
            if (n_values > 0) {
                nc_var.putVar(buf.data());
            }
        }
        return;
    }

    if (const auto* attrs_list { std::get_if<std::vector<Attrs>>(
          &var.values) }) {
        auto nc_var { nc_grp.addVar(name, netCDF::ncString, nc_dims) };
        putAttrs(nc_var, var.attrs);
        std::vector<std::string> texts {};
        for (const auto& attrs : *attrs_list) {
            texts.push_back(encodeAttrs(attrs));
        }
        std::vector<const char*> buf {};
        for (const auto& text : texts) {
            buf.push_back(text.c_str());
        }
        if (n_values > 0) {
            nc_var.putVar(buf.data());
        }
        return;
    }

    auto nc_var { nc_grp.addVar(name, type, nc_dims) };
    if (compress && !nc_dims.empty()) {
        nc_var.setCompression(true, true, compression_level);
    }
    putAttrs(nc_var, var.attrs, type);
    if (n_values == 0) {
        return;
    }
    if (const auto* values { std::get_if<Eigen::ArrayXd>(&var.values) }) {
        nc_var.putVar(values->data());
    } else {
        nc_var.putVar(std::get<ArrayXl>(var.values).data());
    }
}

static auto writeDataset(netCDF::NcGroup& nc_grp,
                         const Dataset& dataset,
                         const bool compress) -> void
{
    for (const auto& [name, size] : dataset.dims()) {
        nc_grp.addDim(name, size);
    }
    for (const auto& name : dataset.variableNames()) {
        writeVariable(nc_grp, name, dataset.variable(name), compress);
    }
    putAttrs(nc_grp, dataset.attrs());
}

auto writeRecord(const std::string& filename,
                 const EchoData& record,
                 const bool compress) -> void
{
    spdlog::info("Writing {}", filename);
    netCDF::NcFile nc { filename,
                        netCDF::NcFile::replace,
                        netCDF::NcFile::nc4 };
    for (const Group group : groupMap()) {
        const auto& dataset { record.group(group) };
        if (!dataset) {
            continue;
        }
        netCDF::NcGroup nc_grp { nc };
        for (const auto& name : splitString(groupPath(group), '/')) {
            const netCDF::NcGroup child { nc_grp.getGroup(name) };
            nc_grp = child.isNull() ? nc_grp.addGroup(name) : child;
        }
        writeDataset(nc_grp, *dataset, compress);
    }
    const auto& top { record.group(Group::top) };
    if (record.sonar_model && !(top && top->attrs().contains("keywords"))) {
        nc.putAtt("keywords", sonarModelToString(*record.sonar_model));
    }
}

} // namespace echomerge

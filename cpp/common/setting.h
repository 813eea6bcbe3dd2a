// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Each user defined configuration parameter is stored in an instance
// of the Setting class. For a primitive type (bool, numbers, enums)
// the value is kept in the "value" field and the class converts
// implicitly to that type, e.g.
//
//   if (settings.compress) {
//       ...
//
// For strings and lists the Setting derives from std::string or
// std::vector so that it can be used directly as that type:
//
//   for (const auto& filename : settings.io_files.inputs) {
//       ...
//
// The yaml_keys field is the chain of node names that locates the
// parameter in a YAML configuration file. For
//
//   io_files:
//     output: combined.nc
//
// yaml_keys = { "io_files", "output" }.

#pragma once

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace echomerge {

// Meta information about a setting: where it lives in the
// configuration file, a description, and a human readable type name.
template <typename T>
class SettingBase
{
public:
    std::vector<std::string> yaml_keys {};
    const std::string info {};
    std::string type {};

    SettingBase() = default;
    SettingBase(const bool is_list,
                const std::vector<std::string>& yaml_keys,
                const std::string& info)
      : yaml_keys { yaml_keys }, info { info }
    {
        const std::string suffix { is_list ? " list" : "" };
        if constexpr (std::is_same_v<T, bool>) {
            type = "boolean" + suffix;
        } else if constexpr (std::is_same_v<T, int>) {
            type = "integer" + suffix;
        } else if constexpr (std::is_same_v<T, size_t>) {
            type = "unsigned integer" + suffix;
        } else if constexpr (std::is_same_v<T, double>) {
            type = "double (float64)" + suffix;
        } else if constexpr (std::is_same_v<T, std::string>) {
            type = "string" + suffix;
        } else if constexpr (std::is_enum_v<T>) {
            type = "string" + suffix;
        } else {
            throw std::domain_error {
                "type not supported by the Setting class. This can be fixed "
                "by introducing 'type' for this type in Setting."
            };
        }
    }
    // Convert the list of YAML keys into a string [a][b]...
    [[nodiscard]] auto keyToStr() const -> std::string
    {
        std::stringstream s {};
        for (const auto& key : yaml_keys) {
            s << '[' << key << ']';
        }
        return s.str();
    }
    ~SettingBase() = default;
};

// Setting class for primitive types
template <typename T>
class Setting : public SettingBase<T>
{
public:
    T value {};

    Setting() = default;
    Setting(const std::vector<std::string>& yaml_keys,
            const T value,
            const std::string& info)
      : SettingBase<T> { false, yaml_keys, info }, value { value }
    {}

    operator T() const { return value; }
    auto operator=(const T& value) -> Setting<T>&
    {
        this->value = value;
        return *this;
    }

    ~Setting() = default;
};

// Setting class for a list of values
template <typename T>
class Setting<std::vector<T>>
  : public SettingBase<T>
  , public std::vector<T>
{
public:
    Setting() = default;
    Setting(const std::vector<std::string>& yaml_keys,
            const std::vector<T> value,
            const std::string& info)
      : SettingBase<T> { true, yaml_keys, info }, std::vector<T> { value }
    {}
    // Assignment acts on the std::vector base of the instance
    auto operator=(const std::vector<T>& value) -> Setting<std::vector<T>>&
    {
        std::vector<T>* base { this };
        *base = value;
        return *this;
    }
};

// Setting class for strings
template <>
class Setting<std::string>
  : public SettingBase<std::string>
  , public std::string
{
public:
    Setting() = default;
    Setting(const std::vector<std::string>& yaml_keys,
            const std::string value,
            const std::string& info)
      : SettingBase<std::string> { false, yaml_keys, info }
      , std::string { value }
    {}
    auto operator=(const std::string& value) -> Setting<std::string>&
    {
        std::string* base { this };
        *base = value;
        return *this;
    }
};

} // namespace echomerge

// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "attrs.h"

#include "errors.h"

#include <algorithm>
#include <sstream>

namespace echomerge {

Attrs::Attrs(std::initializer_list<std::pair<std::string, AttrValue>> init)
{
    for (const auto& [key, value] : init) {
        set(key, value);
    }
}

auto Attrs::contains(const std::string& key) const -> bool
{
    return std::ranges::any_of(
      items, [&key](const auto& item) { return item.first == key; });
}

auto Attrs::at(const std::string& key) const -> const AttrValue&
{
    const auto it { std::ranges::find_if(
      items, [&key](const auto& item) { return item.first == key; }) };
    if (it == items.end()) {
        throw std::out_of_range { "attribute not found: " + key };
    }
    return it->second;
}

auto Attrs::set(const std::string& key, AttrValue value) -> void
{
    const auto it { std::ranges::find_if(
      items, [&key](const auto& item) { return item.first == key; }) };
    if (it == items.end()) {
        items.emplace_back(key, std::move(value));
    } else {
        it->second = std::move(value);
    }
}

auto Attrs::update(const Attrs& other) -> void
{
    for (const auto& [key, value] : other) {
        set(key, value);
    }
}

auto Attrs::erase(const std::string& key) -> void
{
    std::erase_if(items, [&key](const auto& item) { return item.first == key; });
}

auto operator==(const Attrs& lhs, const Attrs& rhs) -> bool
{
    if (lhs.size() != rhs.size()) {
        return false;
    }
    return std::ranges::all_of(lhs, [&rhs](const auto& item) {
        return rhs.contains(item.first) && rhs.at(item.first) == item.second;
    });
}

auto attrValueToString(const AttrValue& value) -> std::string
{
    std::ostringstream out {};
    out.precision(16);
    std::visit(
      [&out](const auto& val) {
          using T = std::decay_t<decltype(val)>;
          if constexpr (std::is_same_v<T, std::string>) {
              out << '"' << val << '"';
          } else if constexpr (std::is_same_v<T, std::vector<double>>) {
              out << '[';
              for (size_t i {}; i < val.size(); ++i) {
                  out << (i > 0 ? ", " : "") << val[i];
              }
              out << ']';
          } else {
              out << val;
          }
      },
      value);
    return out.str();
}

// Union of all collections. A key defined by several collections
// must have the same value in each.
static auto mergeNoConflicts(const std::vector<Attrs>& attrs_list) -> Attrs
{
    Attrs result {};
    for (const auto& attrs : attrs_list) {
        for (const auto& [key, value] : attrs) {
            if (!result.contains(key)) {
                result.set(key, value);
            } else if (result.at(key) != value) {
                throw AttributeConflictError {
                    "conflicting values for attribute '" + key
                    + "': " + attrValueToString(result.at(key)) + " and "
                    + attrValueToString(value)
                };
            }
        }
    }
    return result;
}

auto mergeAttrs(const std::vector<Attrs>& attrs_list,
                const CombineAttrs policy) -> Attrs
{
    if (attrs_list.empty()) {
        return {};
    }
    switch (policy) {
    case CombineAttrs::override:
        return attrs_list.front();
    case CombineAttrs::drop:
        return {};
    case CombineAttrs::identical:
        for (size_t i { 1 }; i < attrs_list.size(); ++i) {
            if (attrs_list[i] != attrs_list.front()) {
                throw AttributeConflictError {
                    "attributes of dataset " + std::to_string(i)
                    + " are not identical to those of dataset 0"
                };
            }
        }
        return attrs_list.front();
    case CombineAttrs::no_conflicts:
        return mergeNoConflicts(attrs_list);
    case CombineAttrs::overwrite_conflicts: {
        Attrs result {};
        for (const auto& attrs : attrs_list) {
            result.update(attrs);
        }
        return result;
    }
    case CombineAttrs::n_policies:
        break;
    }
    throw std::invalid_argument { "invalid attribute policy" };
}

} // namespace echomerge

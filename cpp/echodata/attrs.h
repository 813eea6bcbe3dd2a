// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Attributes (metadata) of a dataset or of a single variable, and
// the policies for merging the global attributes of several datasets
// into one.

#pragma once

#include <common/constants.h>

#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace echomerge {

// An attribute value is text, a single integer, a single floating
// point number, or a numeric list.
using AttrValue =
  std::variant<std::string, int64_t, double, std::vector<double>>;

// Ordered collection of attributes. Keys are unique and keep the
// position of their first insertion.
class Attrs
{
private:
    std::vector<std::pair<std::string, AttrValue>> items {};

public:
    Attrs() = default;
    Attrs(std::initializer_list<std::pair<std::string, AttrValue>> init);

    [[nodiscard]] auto contains(const std::string& key) const -> bool;
    // Throws std::out_of_range if key is not present
    [[nodiscard]] auto at(const std::string& key) const -> const AttrValue&;
    // Insert a new key at the end or replace the value of an existing
    // key in place
    auto set(const std::string& key, AttrValue value) -> void;
    // Apply set to every item of another collection, in its order
    auto update(const Attrs& other) -> void;
    auto erase(const std::string& key) -> void;

    [[nodiscard]] auto size() const -> size_t { return items.size(); }
    [[nodiscard]] auto empty() const -> bool { return items.empty(); }
    [[nodiscard]] auto begin() const { return items.cbegin(); }
    [[nodiscard]] auto end() const { return items.cend(); }

    // Two collections are equal if they hold the same keys with the
    // same values, regardless of order.
    friend auto operator==(const Attrs& lhs, const Attrs& rhs) -> bool;
};

// Text representation of a value for log and error messages
[[nodiscard]] auto attrValueToString(const AttrValue& value) -> std::string;

// Reduce a list of attribute collections into one according to the
// policy. The list is not modified. Throws AttributeConflictError if
// the policy is identical or no_conflicts and the collections
// disagree.
[[nodiscard]] auto mergeAttrs(const std::vector<Attrs>& attrs_list,
                              const CombineAttrs policy) -> Attrs;

} // namespace echomerge

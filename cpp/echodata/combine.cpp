// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "combine.h"

#include "concat_policy.h"
#include "errors.h"
#include "time_reversal.h"

#include <spdlog/spdlog.h>

namespace echomerge {

namespace {

// Time correction state of one combination. The first group with a
// reversed ping_time determines the corrected axis, which is then
// imposed on every following group.
class TimeCorrection
{
private:
    // ping_time before and after the correction
    std::optional<Variable> old_time {};
    std::optional<Variable> new_time {};

public:
    auto apply(Dataset& dataset, const Group group) -> void;
    [[nodiscard]] auto oldTime() const -> const std::optional<Variable>&
    {
        return old_time;
    }
};

} // namespace

auto TimeCorrection::apply(Dataset& dataset, const Group group) -> void
{
    const std::string name { time_coord };
    if (!dataset.hasCoord(name)) {
        return;
    }
    Variable time { dataset.variable(name) };
    const auto* values { std::get_if<ArrayXl>(&time.values) };
    if (values == nullptr) {
        throw std::invalid_argument { groupName(group) + ": " + name
                                      + " does not hold integer time stamps" };
    }
    if (new_time) {
        if (new_time->size() == time.size()) {
            time.values = new_time->values;
        } else if (existReversedTime(*values)) {
            // The corrected axis does not fit this group. Repair its
            // own axis instead, without another warning.
            spdlog::debug("{}: {} has {} entries, corrected axis has {}",
                          groupName(group),
                          name,
                          time.size(),
                          new_time->size());
            time.values = coerceIncreasingTime(*values);
        } else {
            return;
        }
        dataset.setVariable(name, std::move(time));
        return;
    }
    if (!existReversedTime(*values)) {
        return;
    }
    spdlog::warn("{} reversal detected in group {}; the ping times will be "
                 "corrected",
                 name,
                 groupName(group));
    old_time = time;
    time.values = coerceIncreasingTime(*values);
    new_time = time;
    dataset.setVariable(name, std::move(time));
}

// Model shared by all records. Throws ValidationError naming the first
// record with a missing or different model.
static auto validateSonarModels(const std::vector<EchoData>& echodatas)
  -> SonarModel
{
    const auto& first { echodatas.front().sonar_model };
    for (size_t i {}; i < echodatas.size(); ++i) {
        const auto& model { echodatas[i].sonar_model };
        if (!model) {
            throw ValidationError { "record " + std::to_string(i) + " ("
                                    + echodatas[i].origin()
                                    + ") has no sonar model; all records "
                                      "must have one" };
        }
        if (first && *model != *first) {
            throw ValidationError {
                "record " + std::to_string(i) + " (" + echodatas[i].origin()
                + ") has sonar model " + sonarModelToString(*model)
                + " but record 0 has " + sonarModelToString(*first)
                + "; all records must have the same sonar model"
            };
        }
    }
    return *first;
}

// Give the string variables listed for this model and group a fixed
// width. Longer values are truncated.
static auto normalizeStringWidths(Dataset& dataset,
                                  const SonarModel model,
                                  const Group group) -> void
{
    for (const auto& [name, width] : fixedWidthVariables(model, group)) {
        if (!dataset.hasVariable(name)) {
            continue;
        }
        Variable var { dataset.variable(name) };
        auto* strings { std::get_if<std::vector<std::string>>(&var.values) };
        if (strings == nullptr) {
            throw ConcatenationError { groupName(group) + ": " + name
                                       + " is not a string variable" };
        }
        bool truncated { false };
        for (auto& str : *strings) {
            if (str.size() > width) {
                str.resize(width);
                truncated = true;
            }
        }
        if (truncated) {
            spdlog::warn("{}: values of {} truncated to {} characters",
                         groupName(group),
                         name,
                         width);
        }
        var.str_width = width;
        dataset.setVariable(name, std::move(var));
    }
}

// Concatenate the datasets of one group
static auto combineGroup(
  const std::vector<std::shared_ptr<const Dataset>>& parts,
  const Group group,
  const SonarModel model,
  const CombineAttrs combine_attrs,
  const DatasetBackend& backend,
  TimeCorrection& time_correction,
  std::vector<std::pair<Group, std::vector<Attrs>>>& old_attrs)
  -> std::unique_ptr<Dataset>
{
    const auto& spec { concatSpec(model, group) };
    // The union with overwriting is applied separately after
    // concatenation.
    const CombineAttrs concat_attrs {
        combine_attrs == CombineAttrs::overwrite_conflicts ? CombineAttrs::drop
                                                           : combine_attrs
    };
    std::unique_ptr<Dataset> combined {};
    try {
        combined = backend.concat(parts, spec.dims, spec.mode, concat_attrs);
    } catch (const AttributeConflictError& e) {
        throw AttributeConflictError { groupName(group) + ": " + e.what() };
    } catch (const ConcatenationError& e) {
        throw ConcatenationError { groupName(group) + ": " + e.what() };
    }

    std::vector<Attrs> attrs_list {};
    for (const auto& part : parts) {
        attrs_list.push_back(part->attrs());
    }
    if (combine_attrs == CombineAttrs::overwrite_conflicts) {
        combined->setAttrs(mergeAttrs(attrs_list, combine_attrs));
    }
    if (parts.size() > 1) {
        old_attrs.emplace_back(group, std::move(attrs_list));
    }

    normalizeStringWidths(*combined, model, group);
    time_correction.apply(*combined, group);

    if (const std::string dim { synthetic_concat_dim }; combined->hasDim(dim)) {
        combined->dropDim(dim);
    }
    spdlog::info("Group {} combined from {} record(s)",
                 groupName(group),
                 parts.size());
    return combined;
}

auto combineEchodata(const std::vector<EchoData>& echodatas,
                     const CombineAttrs combine_attrs,
                     const SoftwareIdentity& identity,
                     const DatasetBackend& backend) -> EchoData
{
    EchoData result {};
    if (echodatas.empty()) {
        return result;
    }
    const SonarModel model { validateSonarModels(echodatas) };
    result.sonar_model = model;

    TimeCorrection time_correction {};
    // Attributes of every group with more than one dataset, before
    // combination
    std::vector<std::pair<Group, std::vector<Attrs>>> old_attrs {};
    std::unique_ptr<Dataset> provenance {};

    for (const Group group : groupMap()) {
        if (group == Group::top || group == Group::sonar) {
            // Not checked for equality across records
            result.setGroup(group, echodatas.front().group(group));
            continue;
        }
        if (group == Group::provenance) {
            std::vector<std::string> origins {};
            for (const auto& echodata : echodatas) {
                origins.push_back(echodata.origin());
            }
            provenance = assembleProvenance(origins, identity, backend);
            continue;
        }
        std::vector<std::shared_ptr<const Dataset>> parts {};
        for (const auto& echodata : echodatas) {
            if (echodata.group(group)) {
                parts.push_back(echodata.group(group));
            }
        }
        if (parts.empty()) {
            spdlog::debug("Group {} is absent in all records", groupName(group));
            continue;
        }
        result.setGroup(group,
                        combineGroup(parts,
                                     group,
                                     model,
                                     combine_attrs,
                                     backend,
                                     time_correction,
                                     old_attrs));
    }

    if (time_correction.oldTime()) {
        appendOldTime(
          *provenance, std::string { time_coord }, *time_correction.oldTime());
    }
    appendGroupAttrs(*provenance, old_attrs);
    result.setGroup(Group::provenance, std::move(provenance));
    return result;
}

} // namespace echomerge

// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "provenance.h"

#include <common/time.h>

namespace echomerge {

static const std::string software_name { "echomerge" };

auto defaultSoftwareIdentity() -> SoftwareIdentity
{
    return { software_name, ECHOMERGE_PROJECT_VERSION };
}

auto assembleProvenance(const std::vector<std::string>& origins,
                        const SoftwareIdentity& identity,
                        const DatasetBackend& backend)
  -> std::unique_ptr<Dataset>
{
    auto provenance { backend.create() };
    provenance->addDim("file", origins.size());
    Variable src_filenames {};
    src_filenames.dims = { "file" };
    src_filenames.values = origins;
    src_filenames.dtype = DType::str;
    provenance->setVariable("src_filenames", std::move(src_filenames));
    provenance->setAttrs({
      { "conversion_software_name", identity.name },
      { "conversion_software_version", identity.version },
      { "conversion_time", getDateAndTime() },
    });
    return provenance;
}

static auto checkNameFree(const Dataset& provenance,
                          const std::string& name) -> void
{
    if (provenance.hasVariable(name) || provenance.hasDim(name)) {
        throw std::invalid_argument { "provenance group already contains "
                                      + name };
    }
}

auto appendOldTime(Dataset& provenance,
                   const std::string& field,
                   const Variable& time) -> void
{
    const std::string name { "old_" + field };
    checkNameFree(provenance, name);
    Variable old_time { time };
    old_time.dims = { name };
    provenance.addDim(name, time.size());
    provenance.setVariable(name, std::move(old_time));
}

auto appendGroupAttrs(
  Dataset& provenance,
  const std::vector<std::pair<Group, std::vector<Attrs>>>& group_attrs)
  -> void
{
    for (const auto& [group, attrs_list] : group_attrs) {
        const std::string name { groupName(group) + "_attrs" };
        const std::string dim { groupName(group) + "_file" };
        checkNameFree(provenance, name);
        checkNameFree(provenance, dim);
        provenance.addDim(dim, attrs_list.size());
        Variable attrs_var {};
        attrs_var.dims = { dim };
        attrs_var.values = attrs_list;
        attrs_var.dtype = DType::attrs;
        attrs_var.attrs.set("long_name",
                            "attributes of " + groupName(group)
                              + " before combination");
        provenance.setVariable(name, std::move(attrs_var));
    }
}

} // namespace echomerge

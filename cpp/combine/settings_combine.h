// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Class for storing all configuration parameters of the combine tool

#pragma once

#include <common/settings.h>

namespace echomerge {

class SettingsCombine : public Settings
{
private:
    auto checkParameters() -> void override;

public:
    Setting<std::string> processing_version {
        { "processing_version" },
        {},
        "processing toolchain version, recorded in the output history"
    };
    Setting<CombineAttrs> combine_attrs {
        { "combine_attrs" },
        CombineAttrs::override,
        "how the global attributes of each group are combined:\n"
        "override - use the attributes of the first record\n"
        "drop - discard all attributes\n"
        "identical - all records must have the same attributes\n"
        "no_conflicts - union, shared attributes must be equal\n"
        "overwrite_conflicts - union, later records take precedence"
    };
    Setting<bool> compress { { "compress" },
                             true,
                             "whether to compress the combined product" };

    struct
    {
        Setting<std::vector<std::string>> inputs {
            { "io_files", "inputs" },
            {},
            "converted records (input), in the order of acquisition"
        };
        Setting<std::string> output { { "io_files", "output" },
                                      {},
                                      "combined record (output)" };
    } io_files;

    SettingsCombine() = default;
    SettingsCombine(const std::string& yaml_file) : Settings { yaml_file } {}
    auto scanKeys() -> void override;
    ~SettingsCombine() = default;
};

} // namespace echomerge

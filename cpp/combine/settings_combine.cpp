// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "settings_combine.h"

#include <common/io.h>

namespace echomerge {

auto SettingsCombine::scanKeys() -> void
{
    scan(processing_version);
    scan(combine_attrs);
    scan(compress);

    scan(io_files.inputs);
    scan(io_files.output);
}

auto SettingsCombine::checkParameters() -> void
{
    if (io_files.inputs.empty()) {
        throw std::runtime_error { "missing " + io_files.inputs.keyToStr() };
    }
    for (const auto& filename : io_files.inputs) {
        checkPresenceOfFile(filename, io_files.inputs.keyToStr(), true);
    }
    if (io_files.output.empty()) {
        throw std::runtime_error { "missing " + io_files.output.keyToStr() };
    }
    checkFileWritable(io_files.output);
}

} // namespace echomerge

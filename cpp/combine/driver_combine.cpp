// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "driver_combine.h"

#include "settings_combine.h"

#include <common/io.h>
#include <common/time.h>
#include <common/timer.h>
#include <echodata/combine.h>
#include <echodata/record_io.h>
#include <spdlog/spdlog.h>

namespace echomerge {

// Record in the top group how the combined product was generated
static auto addHistory(EchoData& record,
                       const std::string& config,
                       const std::string& processing_version,
                       const int argc,
                       const char* const argv[]) -> void
{
    const auto& top { record.group(Group::top) };
    auto dataset { top ? top->clone() : memoryBackend().create() };
    Attrs attrs { dataset->attrs() };
    std::string command_line { argc > 0 ? argv[0] : "" };
    for (int i { 1 }; i < argc; ++i) {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        command_line += ' ' + std::string(argv[i]);
    }
    attrs.set("history", getDateAndTime() + ": " + command_line);
    attrs.set("processing_version", processing_version);
    attrs.set("configuration", config);
    if (std::string { ECHOMERGE_GIT_COMMIT_ABBREV } != "GITDIR-N") {
        attrs.set("git_commit", ECHOMERGE_GIT_COMMIT_ABBREV);
    }
    dataset->setAttrs(std::move(attrs));
    record.setGroup(Group::top, std::move(dataset));
}

auto driver(const SettingsCombine& settings,
            const int argc,
            const char* const argv[]) -> void
{
    // Set up loggers and print general information
    initLogging();
    printHeading("Echosounder record combination", false);
    printSystemInfo(ECHOMERGE_PROJECT_VERSION,
                    ECHOMERGE_GIT_COMMIT_ABBREV,
                    ECHOMERGE_CMAKE_HOST_SYSTEM,
                    ECHOMERGE_EXECUTABLE,
                    ECHOMERGE_CXX_COMPILER,
                    ECHOMERGE_CXX_COMPILER_FLAGS,
                    ECHOMERGE_LIBRARIES);

    Timer timer {};

    // Read in data
    printHeading("Reading input data");
    std::vector<EchoData> records {};
    for (const auto& filename : settings.io_files.inputs) {
        records.push_back(readRecord(filename));
    }
    timer.lap("reading");

    printHeading("Combining records");
    spdlog::info("Attribute policy: {}",
                 combineAttrsToString(settings.combine_attrs));
    EchoData combined { combineEchodata(records, settings.combine_attrs) };
    addHistory(combined,
               settings.getConfig(),
               settings.processing_version,
               argc,
               argv);
    timer.lap("combining");

    printHeading("Writing output");
    writeRecord(settings.io_files.output, combined, settings.compress);
    timer.lap("writing");

    spdlog::info("");
    for (const auto& [stage, seconds] : timer.stages()) {
        spdlog::info("Time spent {:10}: {:8.3f} s", stage, seconds);
    }
    spdlog::info("Total time: {:8.3f} s", timer.total());

    printHeading("Success");
}

} // namespace echomerge

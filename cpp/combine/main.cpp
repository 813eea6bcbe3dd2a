// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "driver_combine.h"
#include "settings_combine.h"

#include <iostream>

auto main(int argc, char* argv[]) -> int
{
    std::cout.precision(16);
    if (argc == 1) {
        // When called without an argument print the default
        // configuration.
        std::cout << "%YAML 1.2\n---\n"
                  << echomerge::SettingsCombine {}.c_str() << '\n';
    } else {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        echomerge::SettingsCombine settings { argv[1] };
        settings.init();
        echomerge::driver(settings, argc, argv);
    }
    return 0;
}

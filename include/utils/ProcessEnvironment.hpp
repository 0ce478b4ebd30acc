// © 2026 Beatrix Zselezny. All rights reserved.
// Lanwatch LAN-Cache Transfer Monitor

#ifndef LANWATCH_PROCESS_ENVIRONMENT_HPP
#define LANWATCH_PROCESS_ENVIRONMENT_HPP

#include <string>
#include <vector>

namespace LanwatchUtils {
    /**
     * @brief A gyerekfolyamat (szonda, log manager) sterilizált környezete.
     * Fix PATH, és a TZ változó, ha a hoszt folyamatban be van állítva.
     */
    std::vector<std::string> buildChildEnvironment();

    /**
     * @brief A futtatható fájl könyvtára, ez lesz a gyerek munkakönyvtára.
     */
    std::string executableDirectory(const std::string& executablePath);
}

#endif

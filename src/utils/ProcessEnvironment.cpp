// © 2026 Beatrix Zselezny. All rights reserved.
// Lanwatch LAN-Cache Transfer Monitor

#include "utils/ProcessEnvironment.hpp"
#include <cstdlib>
#include <filesystem>

namespace LanwatchUtils {

    std::vector<std::string> buildChildEnvironment() {
        // Semmi LD_PRELOAD / LD_LIBRARY_PATH öröklés: csak amit kifejezetten átadunk
        std::vector<std::string> env = {
            "PATH=/usr/sbin:/usr/bin:/sbin:/bin"
        };

        const char* tz = std::getenv("TZ");
        if (tz != nullptr && tz[0] != '\0') {
            env.push_back(std::string("TZ=") + tz);
        }
        return env;
    }

    std::string executableDirectory(const std::string& executablePath) {
        std::filesystem::path dir = std::filesystem::path(executablePath).parent_path();
        return dir.empty() ? std::string(".") : dir.string();
    }
}

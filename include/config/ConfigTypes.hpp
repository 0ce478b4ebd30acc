// © 2026 Beatrix Zselezny. All rights reserved.
// Lanwatch LAN-Cache Transfer Monitor

#ifndef LANWATCH_CONFIG_TYPES_HPP
#define LANWATCH_CONFIG_TYPES_HPP

#include <stdexcept>
#include <string>

namespace Lanwatch::Config {

    // Egy konfigurált LAN-cache adatforrás; a core csak olvassa
    struct Datasource {
        std::string name;       // kanonikus írásmód
        std::string logPath;    // log könyvtár
        std::string cachePath;
        bool enabled = true;
        bool isDefault = false;
    };

    class ConfigError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };
}

#endif // LANWATCH_CONFIG_TYPES_HPP

// © 2026 Beatrix Zselezny. All rights reserved.
// Lanwatch LAN-Cache Transfer Monitor

#include "config/DatasourceRegistry.hpp"
#include "utils/StringUtils.hpp"

#include <filesystem>
#include <map>

namespace fs = std::filesystem;

namespace Lanwatch::Config {

    std::vector<Datasource> DatasourceRegistry::enabledDatasources() const {
        std::vector<Datasource> enabled;
        for (const auto& ds : datasources()) {
            if (ds.enabled) enabled.push_back(ds);
        }
        return enabled;
    }

    std::optional<Datasource> DatasourceRegistry::find(const std::string& name) const {
        for (const auto& ds : datasources()) {
            if (LanwatchUtils::iequals(ds.name, name)) return ds;
        }
        return std::nullopt;
    }

    // --- Configured registry ---

    ConfiguredDatasourceRegistry::ConfiguredDatasourceRegistry(std::vector<Datasource> configured)
        : entries(std::move(configured)) {
        validate(entries);

        for (size_t i = 0; i < entries.size(); ++i) {
            if (entries[i].isDefault) {
                defaultIndex = i;
                break;
            }
        }
        // Jelölés nélkül az első a default
        if (!defaultIndex && !entries.empty()) {
            defaultIndex = 0;
            entries[0].isDefault = true;
        }
    }

    std::optional<Datasource> ConfiguredDatasourceRegistry::defaultDatasource() const {
        if (!defaultIndex) return std::nullopt;
        return entries[*defaultIndex];
    }

    void ConfiguredDatasourceRegistry::validate(const std::vector<Datasource>& configured) {
        size_t defaults = 0;
        for (const auto& ds : configured) {
            if (LanwatchUtils::trim(ds.name).empty()) {
                throw ConfigError("datasource with an empty name");
            }
            if (ds.isDefault) defaults++;
        }

        if (defaults > 1) {
            throw ConfigError("more than one datasource is marked as default");
        }

        if (auto collision = findNameCollision(configured)) {
            throw ConfigError("datasource names collide under case-folding: '" +
                              collision->first + "' and '" + collision->second + "'");
        }
    }

    std::optional<std::pair<std::string, std::string>> findNameCollision(const std::vector<Datasource>& datasources) {
        std::map<std::string, std::string> seen;
        for (const auto& ds : datasources) {
            auto [it, inserted] = seen.emplace(LanwatchUtils::toLower(ds.name), ds.name);
            if (!inserted) {
                return std::make_pair(it->second, ds.name);
            }
        }
        return std::nullopt;
    }

    std::string resolveLogDirectory(const std::string& logPath) {
        fs::path path(logPath);
        std::string file = LanwatchUtils::toLower(path.filename().string());

        if (file.rfind("access", 0) == 0 && file.size() >= 4 &&
            file.compare(file.size() - 4, 4, ".log") == 0) {
            return path.parent_path().string();
        }
        return logPath;
    }
}

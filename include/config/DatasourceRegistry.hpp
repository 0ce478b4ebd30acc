// © 2026 Beatrix Zselezny. All rights reserved.
// Lanwatch LAN-Cache Transfer Monitor
// Named datasources and the designated default

#ifndef LANWATCH_DATASOURCE_REGISTRY_HPP
#define LANWATCH_DATASOURCE_REGISTRY_HPP

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "config/ConfigTypes.hpp"

namespace Lanwatch::Config {

    class DatasourceRegistry {
    public:
        virtual ~DatasourceRegistry() = default;

        // Minden konfigurált datasource, a letiltottak is (a normalizálás ismeri őket)
        virtual std::vector<Datasource> datasources() const = 0;

        virtual std::optional<Datasource> defaultDatasource() const = 0;

        // Csak az engedélyezettek: ezek mennek a szondának és az inventorynak
        std::vector<Datasource> enabledDatasources() const;

        // Case-insensitive keresés
        std::optional<Datasource> find(const std::string& name) const;
    };

    /**
     * @brief A konfigurációs fájlból épített, betöltéskor validált registry.
     * Üres név, egynél több "default" jelölés vagy case-foldingban ütköző
     * nevek: ConfigError.
     */
    class ConfiguredDatasourceRegistry : public DatasourceRegistry {
    private:
        std::vector<Datasource> entries;
        std::optional<size_t> defaultIndex;

    public:
        explicit ConfiguredDatasourceRegistry(std::vector<Datasource> configured);

        std::vector<Datasource> datasources() const override { return entries; }
        std::optional<Datasource> defaultDatasource() const override;

        static void validate(const std::vector<Datasource>& configured);
    };

    // Ha két név case-foldingban egyezik, az elsőként ütköző párt adja vissza
    std::optional<std::pair<std::string, std::string>> findNameCollision(const std::vector<Datasource>& datasources);

    /**
     * @brief Egy access*.log fájlra mutató log útvonalból a könyvtárát adja,
     * minden más útvonalat változatlanul hagy.
     */
    std::string resolveLogDirectory(const std::string& logPath);
}

#endif // LANWATCH_DATASOURCE_REGISTRY_HPP

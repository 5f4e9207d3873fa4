/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <orbitcast/scenario.hpp>
#include <orbitcast/celestrak.hpp>

#include <stdexcept>

#include <spdlog/spdlog.h>

using spdlog::debug;

namespace orbitcast {

bool Scenario::isGenerated() const {
    return std::holds_alternative<WalkerParameters>(source);
}

ScenarioRegistry ScenarioRegistry::withDefaults(time_point now, const std::string &elementSourceURL) {
    ScenarioRegistry registry;

    auto celestrak = [&](const std::string &id, const std::string &name,
                         const std::string &description, const std::string &group) {
        registry.add(Scenario{
            .id = id,
            .name = name,
            .description = description,
            .createdAt = now,
            .source = ExternalSource{celestrak::groupURL(elementSourceURL, group)}
        });
    };

    auto walker = [&](const std::string &id, const std::string &name,
                      const std::string &description, WalkerParameters parameters) {
        registry.add(Scenario{
            .id = id,
            .name = name,
            .description = description,
            .createdAt = now,
            .source = parameters
        });
    };

    celestrak("starlink", "Starlink Constellation", "SpaceX Starlink broadband satellites", "starlink");
    celestrak("gps", "GPS Constellation", "US Global Positioning System satellites", "gps-ops");
    celestrak("iridium", "Iridium NEXT", "Iridium satellite phone constellation", "iridium-NEXT");
    celestrak("space-stations", "Space Stations", "ISS and other crewed stations", "stations");
    celestrak("oneweb", "OneWeb Constellation", "OneWeb broadband satellites", "oneweb");
    celestrak("active", "All Active Satellites", "All currently active satellites (large dataset)", "active");

    walker("gps-constellation", "GPS Walker Constellation",
           "Simulated GPS: 6 planes x 4 satellites at 20200 km, 55 deg",
           {.planes = 6, .satellitesPerPlane = 4, .altitude = 20200.0, .inclination = 55.0, .regime = OrbitRegime::MEO});
    walker("galileo-constellation", "Galileo Walker Constellation",
           "Simulated Galileo: 3 planes x 8 satellites at 23222 km, 56 deg",
           {.planes = 3, .satellitesPerPlane = 8, .altitude = 23222.0, .inclination = 56.0, .regime = OrbitRegime::MEO});
    walker("iridium-constellation", "Iridium Walker Constellation",
           "Simulated Iridium: 6 planes x 11 satellites at 780 km, 86.4 deg",
           {.planes = 6, .satellitesPerPlane = 11, .altitude = 780.0, .inclination = 86.4, .regime = OrbitRegime::LEO});
    walker("oneweb-constellation", "OneWeb Walker Constellation",
           "Simulated OneWeb: 18 planes x 36 satellites at 1200 km, 87.9 deg",
           {.planes = 18, .satellitesPerPlane = 36, .altitude = 1200.0, .inclination = 87.9, .regime = OrbitRegime::LEO});
    walker("starlink-shell", "Starlink Shell 1",
           "Simulated Starlink shell: 72 planes x 22 satellites at 550 km, 53 deg",
           {.planes = 72, .satellitesPerPlane = 22, .altitude = 550.0, .inclination = 53.0, .regime = OrbitRegime::LEO});

    return registry;
}

void ScenarioRegistry::add(Scenario scenario) {
    if (index.contains(scenario.id)) {
        throw std::invalid_argument("Scenario already registered: " + scenario.id);
    }

    if (const auto *parameters = std::get_if<WalkerParameters>(&scenario.source)) {
        scenario.satelliteCount = parameters->total();
    } else {
        scenario.satelliteCount = 0;
    }

    debug("Registered scenario {} ({})", scenario.id, scenario.name);
    index[scenario.id] = scenarios.size();
    scenarios.push_back(std::move(scenario));
}

std::optional<Scenario> ScenarioRegistry::find(const std::string &id) const {
    auto it = index.find(id);
    if (it == index.end()) {
        return std::nullopt;
    }
    return scenarios[it->second];
}

bool ScenarioRegistry::contains(const std::string &id) const {
    return index.contains(id);
}

std::vector<Scenario> ScenarioRegistry::list() const {
    return scenarios;
}

std::size_t ScenarioRegistry::size() const {
    return scenarios.size();
}

void ScenarioRegistry::updateCount(const std::string &id, int count) {
    auto it = index.find(id);
    if (it != index.end()) {
        scenarios[it->second].satelliteCount = count;
    }
}

}

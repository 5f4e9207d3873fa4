/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <orbitcast/catalog.hpp>
#include <orbitcast/tle.hpp>

#include <memory>
#include <stdexcept>

#include <spdlog/spdlog.h>

using spdlog::debug;
using spdlog::info;
using spdlog::error;

namespace orbitcast {

Catalog::Catalog(ScenarioRegistry &registry, SatelliteCache &cache, ConstellationGenerator &generator,
                 ElementFetcher fetcher, Clock clock)
    : registry(registry), cache(cache), generator(generator), fetcher(std::move(fetcher)), clock(std::move(clock)) {}

const ScenarioRegistry& Catalog::getRegistry() const {
    return registry;
}

std::string Catalog::dataSource(const std::string &scenarioID) const {
    auto scenario = registry.find(scenarioID);
    if (scenario && scenario->isGenerated()) {
        return "Walker Generator";
    }
    return "CelesTrak";
}

SatelliteSet Catalog::build(const Scenario &scenario) {
    if (const auto *parameters = std::get_if<WalkerParameters>(&scenario.source)) {
        return generator.generate(scenario.id, *parameters, clock());
    }

    const auto &source = std::get<ExternalSource>(scenario.source);
    if (!fetcher) {
        throw std::runtime_error("No element source configured for " + source.url);
    }
    return parseTLE(fetcher(source.url));
}

SharedSatelliteSet Catalog::materialize(const std::string &scenarioID) {
    if (auto cached = cache.get(scenarioID)) {
        debug("Using cached satellites for {}", scenarioID);
        return *cached;
    }

    auto scenario = registry.find(scenarioID);
    if (!scenario) {
        debug("Unknown scenario {}", scenarioID);
        return std::make_shared<const SatelliteSet>();
    }

    SharedSatelliteSet satellites;
    try {
        satellites = std::make_shared<const SatelliteSet>(build(*scenario));
    } catch (const std::exception &e) {
        error("Error loading satellites for {}: {}", scenarioID, e.what());
        return std::make_shared<const SatelliteSet>();
    }

    registry.updateCount(scenarioID, static_cast<int>(satellites->size()));
    cache.set(scenarioID, satellites);
    info("Loaded {} satellites for {}", satellites->size(), scenarioID);
    return satellites;
}

}

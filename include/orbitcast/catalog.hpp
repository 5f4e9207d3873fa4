/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __ORBITCAST_CATALOG_HPP
#define __ORBITCAST_CATALOG_HPP

#include <orbitcast/cache.hpp>
#include <orbitcast/elements.hpp>
#include <orbitcast/generator.hpp>
#include <orbitcast/scenario.hpp>

#include <functional>
#include <string>

namespace orbitcast {

/**
 * Downloads the two-line element text at a URL.
 * Throws a std::exception on failure.
 */
using ElementFetcher = std::function<std::string(const std::string &url)>;

/**
 * Builds and caches the satellite set of each scenario.
 */
class Catalog {
public:
    Catalog(ScenarioRegistry &registry, SatelliteCache &cache, ConstellationGenerator &generator,
            ElementFetcher fetcher, Clock clock = systemClock());
    ~Catalog() = default;

    /**
     * Satellite set of a scenario.
     *
     * A cached set is returned while it is fresh. Otherwise the set is
     * downloaded and parsed, or generated, then cached and the scenario's
     * count is updated. Unknown scenarios and failed downloads yield an
     * empty set and nothing is cached.
     */
    SharedSatelliteSet materialize(const std::string &scenarioID);

    /**
     * "CelesTrak" for downloaded scenarios, "Walker Generator" for generated ones.
     */
    std::string dataSource(const std::string &scenarioID) const;

    const ScenarioRegistry& getRegistry() const;

private:
    SatelliteSet build(const Scenario &scenario);

    ScenarioRegistry &registry;
    SatelliteCache &cache;
    ConstellationGenerator &generator;
    ElementFetcher fetcher;
    Clock clock;
};

}

#endif

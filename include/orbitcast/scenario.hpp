/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __ORBITCAST_SCENARIO_HPP
#define __ORBITCAST_SCENARIO_HPP

#include <orbitcast/elements.hpp>
#include <orbitcast/generator.hpp>

#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace orbitcast {

/**
 * A scenario whose satellites are downloaded as two-line elements.
 */
struct ExternalSource {
    std::string url;
};

using ScenarioSource = std::variant<ExternalSource, WalkerParameters>;

/**
 * A named group of satellites.
 *
 * The satellite count is only authoritative after the scenario has been
 * materialized at least once.
 */
struct Scenario {
    std::string id;
    std::string name;
    std::string description;
    int satelliteCount = 0;
    time_point createdAt;
    double durationHours = 24.0;
    ScenarioSource source;

    bool isGenerated() const;
};

/**
 * Scenario definitions in registration order.
 */
class ScenarioRegistry {
public:
    ScenarioRegistry() = default;
    ~ScenarioRegistry() = default;

    /**
     * Registry preloaded with the CelesTrak groups and the generated
     * Walker constellations.
     *
     * @param now Creation time of every scenario
     * @param elementSourceURL Base URL of the CelesTrak GP endpoint
     */
    static ScenarioRegistry withDefaults(time_point now,
                                         const std::string &elementSourceURL = "https://celestrak.org/NORAD/elements/gp.php");

    /**
     * Registers a scenario. External scenarios start with a count of 0,
     * generated ones with their nominal size.
     *
     * @throws std::invalid_argument if the id is already registered
     */
    void add(Scenario scenario);

    std::optional<Scenario> find(const std::string &id) const;
    bool contains(const std::string &id) const;
    std::vector<Scenario> list() const;
    std::size_t size() const;

    /**
     * Records the size of the latest materialization.
     * Unknown ids are ignored.
     */
    void updateCount(const std::string &id, int count);

private:
    std::vector<Scenario> scenarios;
    std::map<std::string, std::size_t> index;
};

}

#endif

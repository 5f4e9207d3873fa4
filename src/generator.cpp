/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <orbitcast/generator.hpp>

#include <algorithm>
#include <cctype>
#include <functional>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

using spdlog::debug;

namespace orbitcast {

int WalkerParameters::total() const {
    if (planes <= 0 || satellitesPerPlane <= 0) {
        return 0;
    }
    return planes * satellitesPerPlane;
}

ConstellationGenerator::ConstellationGenerator(bool deterministic)
    : deterministic(deterministic), rng(std::random_device{}()) {}

bool ConstellationGenerator::isDeterministic() const {
    return deterministic;
}

std::uint32_t ConstellationGenerator::seedFor(const std::string &prefix) {
    auto h = std::hash<std::string>{}(prefix);
    return static_cast<std::uint32_t>(h ^ (h >> 32));
}

SatelliteSet ConstellationGenerator::generate(const std::string &prefix, const WalkerParameters &parameters, time_point epoch) {
    SatelliteSet satellites;
    if (parameters.total() == 0) {
        return satellites;
    }

    if (deterministic) {
        rng.seed(seedFor(prefix));
    }

    std::uniform_real_distribution<double> eccentricityJitter(0.0, 0.005);
    std::uniform_real_distribution<double> inclinationJitter(-0.5, 0.5);
    std::uniform_real_distribution<double> periapsisAngle(0.0, 360.0);

    std::string upperPrefix = prefix;
    std::transform(upperPrefix.begin(), upperPrefix.end(), upperPrefix.begin(),
                   [](unsigned char c) { return std::toupper(c); });

    const int P = parameters.planes;
    const int S = parameters.satellitesPerPlane;
    satellites.reserve(parameters.total());

    for (int p = 0; p < P; ++p) {
        double raan = 360.0 * p / P;

        for (int s = 0; s < S; ++s) {
            // Walker-delta phasing between planes
            double phase = normalizeDegrees(360.0 * s / S + 360.0 * p / (P * S));

            KeplerianElements elements{
                .semiMajorAxis = EARTH_RADIUS_KM + parameters.altitude,
                .eccentricity = 0.001 + eccentricityJitter(rng),
                .inclination = parameters.inclination + inclinationJitter(rng),
                .rightAscensionOfAscendingNode = raan,
                .argumentOfPeriapsis = periapsisAngle(rng),
                .trueAnomaly = phase,
                .epoch = epoch
            };

            satellites.emplace_back(
                fmt::format("{}-P{:02}-S{:02}", prefix, p + 1, s + 1),
                fmt::format("{} P{}-S{}", upperPrefix, p + 1, s + 1),
                elements,
                "active",
                epoch);
        }
    }

    if (!satellites.empty() && satellites.front().getRegime() != parameters.regime) {
        debug("Generated {} satellites classify as {}, nominal regime is {}",
              prefix, toString(satellites.front().getRegime()), toString(parameters.regime));
    }

    debug("Generated {} satellites for {}", satellites.size(), prefix);
    return satellites;
}

}

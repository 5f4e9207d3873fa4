/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __ORBITCAST_GENERATOR_HPP
#define __ORBITCAST_GENERATOR_HPP

#include <orbitcast/elements.hpp>

#include <cstdint>
#include <random>
#include <string>

namespace orbitcast {

/**
 * Design parameters of a Walker-delta constellation.
 */
struct WalkerParameters {
    int planes = 0;
    int satellitesPerPlane = 0;
    double altitude = 0.0;          ///< km above the spherical Earth
    double inclination = 0.0;       ///< degrees
    OrbitRegime regime = OrbitRegime::LEO;

    int total() const;
};

/**
 * Synthesizes Walker-delta constellations with small random perturbations.
 *
 * Plane p of P has RAAN 360 p / P. Satellite s of S in that plane starts at
 * 360 s / S + 360 p / (P S) degrees. Eccentricity, inclination and argument
 * of periapsis are jittered per satellite.
 *
 * By default the random source is seeded once from std::random_device, so two
 * generations with the same parameters differ. In deterministic mode the
 * source is reseeded from the name prefix before every generation.
 */
class ConstellationGenerator {
public:
    explicit ConstellationGenerator(bool deterministic = false);
    ~ConstellationGenerator() = default;

    /**
     * Generates planes x satellitesPerPlane satellites in plane-major order.
     * Ids have the form "{prefix}-P{plane:02}-S{sat:02}" counting from 1.
     *
     * @param epoch Element epoch and launch date of every satellite
     */
    SatelliteSet generate(const std::string &prefix, const WalkerParameters &parameters, time_point epoch);

    bool isDeterministic() const;

    static std::uint32_t seedFor(const std::string &prefix);

private:
    bool deterministic;
    std::mt19937 rng;
};

}

#endif

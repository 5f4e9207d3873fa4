/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __ORBITCAST_PROPAGATOR_HPP
#define __ORBITCAST_PROPAGATOR_HPP

#include <orbitcast/elements.hpp>

#include <optional>
#include <string>
#include <vector>

namespace orbitcast {

/**
 * Geodetic position of a satellite at one instant.
 */
struct PositionSample {
    std::string id;
    std::string name;
    OrbitRegime regime;
    double longitude;   ///< Degrees, (-180, 180]
    double latitude;    ///< Degrees, [-90, 90]
    double altitude;    ///< Meters above the spherical Earth
    double speed;       ///< km/s
};

/**
 * Converts an Earth-centered position (km) and speed (km/s) into a sample
 * using a spherical Earth. Returns nothing if any value isn't finite.
 */
std::optional<PositionSample> toPositionSample(const Satellite &satellite,
                                               double x, double y, double z, double speed);

/**
 * Advances a satellite to a target time.
 *
 * An empty result means propagation failed for this satellite. Failures are
 * never fatal; callers drop the satellite from their results.
 */
class Propagator {
public:
    virtual ~Propagator() = default;

    virtual std::optional<PositionSample> propagate(const Satellite &satellite, time_point t) const = 0;

    /**
     * Name reported in position metadata.
     */
    virtual std::string name() const = 0;
};

/**
 * SGP4/SDP4 propagation of two-line element sets.
 */
class Sgp4Propagator : public Propagator {
public:
    std::optional<PositionSample> propagate(const Satellite &satellite, time_point t) const override;
    std::string name() const override;
};

struct KeplerSolverOptions {
    int iterations = 10;        ///< Fixed-point iterations of E = M + e sin E
    double tolerance = 0.0;     ///< Stop early once |E(k+1) - E(k)| <= tolerance, 0 never stops early
};

/**
 * Solves Kepler's equation M = E - e sin E for the eccentric anomaly (radians).
 */
double solveKepler(double meanAnomaly, double eccentricity, const KeplerSolverOptions &options = {});

/**
 * Analytic two-body propagation of Keplerian element sets.
 *
 * The stored true anomaly is advanced as if it were a mean anomaly.
 * Earth rotation is not applied.
 */
class TwoBodyPropagator : public Propagator {
public:
    TwoBodyPropagator() = default;
    explicit TwoBodyPropagator(KeplerSolverOptions options);

    std::optional<PositionSample> propagate(const Satellite &satellite, time_point t) const override;
    std::string name() const override;

    const KeplerSolverOptions& getOptions() const;

private:
    KeplerSolverOptions options;
};

/**
 * Dispatches each satellite to the strategy matching its element set.
 */
class CompositePropagator : public Propagator {
public:
    CompositePropagator() = default;
    explicit CompositePropagator(KeplerSolverOptions options);

    std::optional<PositionSample> propagate(const Satellite &satellite, time_point t) const override;
    std::string name() const override;

    /**
     * Name of the strategy used for a satellite set, based on its first member.
     */
    std::string nameFor(const SatelliteSet &satellites) const;

private:
    Sgp4Propagator sgp4;
    TwoBodyPropagator twoBody;
};

}

#endif

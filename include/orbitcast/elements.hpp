/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __ORBITCAST_ELEMENTS_HPP
#define __ORBITCAST_ELEMENTS_HPP

#include <orbitcast/sgp4.hpp>

#include <chrono>
#include <cmath>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace orbitcast {

using time_point = std::chrono::system_clock::time_point;

// Spherical Earth used for geodetic output and the two-body model
constexpr double EARTH_RADIUS_KM = 6371.0;
constexpr double MU_EARTH = 398600.4418;           // km^3/s^2
constexpr double MINUTES_PER_DAY = 1440.0;

// Degree-radian conversion factors
constexpr double DEGREES_TO_RADIANS = M_PI / 180.0;
constexpr double RADIANS_TO_DEGREES = 180.0 / M_PI;

/**
 * Normalizes an angle in degrees to [0, 360).
 */
double normalizeDegrees(double degrees);

// ============================================================================
// Orbit Regimes
// ============================================================================

enum class OrbitRegime {
    LEO,
    MEO,
    GEO,
    HEO
};

std::ostream& operator<<(std::ostream &os, const OrbitRegime &regime);

/**
 * Wire name of a regime ("LEO", "MEO", "GEO" or "HEO").
 */
std::string toString(OrbitRegime regime);

/**
 * Classifies an orbit from its mean motion (revolutions per day) and eccentricity.
 *
 * The period in minutes is 1440 / meanMotion:
 *   period < 128                           -> LEO
 *   period < 720                           -> MEO
 *   1430 < period < 1450 and e < 0.01      -> GEO
 *   anything else                          -> HEO
 *
 * A non-positive mean motion has no period and is classified HEO.
 */
OrbitRegime classify(double meanMotionRevPerDay, double eccentricity);

/** Classifies an orbit from its period in minutes, using the windows above. */
OrbitRegime classifyPeriod(double periodInMinutes, double eccentricity);

// ============================================================================
// Element Sets
// ============================================================================

/**
 * Orbital elements decoded from a two-line element set.
 * Angles are in degrees, mean motion is in revolutions per day.
 */
struct TwoLineElements {
    std::string catalogID;
    std::string line1;
    std::string line2;

    // First line
    char classification = 'U';
    std::string designator;
    time_point epoch;
    double firstDerivativeMeanMotion = 0.0;
    double secondDerivativeMeanMotion = 0.0;
    double bstarDragTerm = 0.0;
    int elementSetNumber = 0;

    // Second line
    double inclination = 0.0;
    double rightAscensionOfAscendingNode = 0.0;
    double eccentricity = 0.0;
    double argumentOfPerigee = 0.0;
    double meanAnomaly = 0.0;
    double meanMotion = 0.0;
    int revolutionNumberAtEpoch = 0;
};

/**
 * Classical elements of a two-body orbit.
 * Semi-major axis is in kilometers, angles are in degrees.
 */
struct KeplerianElements {
    double semiMajorAxis = 0.0;
    double eccentricity = 0.0;
    double inclination = 0.0;
    double rightAscensionOfAscendingNode = 0.0;
    double argumentOfPeriapsis = 0.0;
    double trueAnomaly = 0.0;
    time_point epoch;

    // Mean motion in radians per second
    double meanMotion() const;

    // Orbital period in minutes
    double period() const;

    // Mean motion in revolutions per day
    double revolutionsPerDay() const;
};

using ElementSet = std::variant<TwoLineElements, KeplerianElements>;

OrbitRegime classify(const TwoLineElements &elements);
OrbitRegime classify(const KeplerianElements &elements);
OrbitRegime classify(const ElementSet &elements);

// ============================================================================
// Satellite
// ============================================================================

/**
 * An orbiting object with a fixed element set.
 *
 * The regime is derived from the element set when the satellite is built and
 * never changes afterwards. A satellite with two-line elements lazily builds
 * its SGP4 record on first use.
 */
class Satellite {
public:
    Satellite(std::string id, std::string name, ElementSet elements);
    Satellite(std::string id, std::string name, ElementSet elements,
              std::string status, time_point launchDate);
    ~Satellite() = default;

    std::string getID() const;
    std::string getName() const;
    OrbitRegime getRegime() const;
    const ElementSet& getElements() const;

    // Only generated satellites carry a status and launch date
    std::optional<std::string> getStatus() const;
    std::optional<time_point> getLaunchDate() const;

    /**
     * SGP4 record for the satellite's two-line elements.
     *
     * @throws std::logic_error if the satellite has Keplerian elements
     * @throws sgp4::SGP4Exception if the elements cannot be initialized
     */
    const sgp4::State& getSGP4State() const;

private:
    std::string id;
    std::string name;
    OrbitRegime regime;
    ElementSet elements;
    std::optional<std::string> status;
    std::optional<time_point> launchDate;

    mutable std::optional<sgp4::State> sgp4State_;
};

using SatelliteSet = std::vector<Satellite>;
using SharedSatelliteSet = std::shared_ptr<const SatelliteSet>;

/**
 * Converts a time_point to Julian Date.
 */
double toJulianDate(time_point tp);

}

#endif

/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 *
 * SGP4/SDP4 Satellite Propagation Module
 * Based on the Vallado reference implementation from CelesTrak.
 * See: https://celestrak.org/software/vallado-sw.php
 */

#ifndef __ORBITCAST_SGP4_HPP
#define __ORBITCAST_SGP4_HPP

#include <cmath>
#include <stdexcept>
#include <string>

namespace orbitcast::sgp4 {

// ============================================================================
// SGP4 Constants
// ============================================================================

// WGS-72 constants used by the model (not the spherical Earth used for output)
constexpr double MU = 398600.8;                    // Earth gravitational parameter (km^3/s^2)
constexpr double RADIUS_EARTH_KM = 6378.135;       // Earth equatorial radius (km)
constexpr double J2 = 0.001082616;                 // Second gravitational zonal harmonic
constexpr double J3 = -0.00000253881;              // Third gravitational zonal harmonic
constexpr double J4 = -0.00000165597;              // Fourth gravitational zonal harmonic
constexpr double J3OJ2 = J3 / J2;
constexpr double XKE = 0.0743669161331734132;      // sqrt(GM) in Earth radii^1.5/min
constexpr double TUMIN = 13.44683969695931;        // Minutes per time unit
constexpr double VKMPERSEC = 7.905366149846074;    // km/s per velocity unit
constexpr double TWO_PI = 2.0 * M_PI;
constexpr double X2O3 = 2.0 / 3.0;
constexpr double EARTH_ROTATION_RATE = 4.37526908801129966e-3;  // rad/min

// ============================================================================
// SGP4 Error Codes
// ============================================================================

/**
 * Error codes as numbered by the reference implementation.
 */
enum ErrorCode {
    NONE = 0,
    MEAN_ECCENTRICITY_OUT_OF_RANGE = 1,
    MEAN_MOTION_NOT_POSITIVE = 2,
    PERTURBED_ECCENTRICITY_OUT_OF_RANGE = 3,
    SEMI_LATUS_RECTUM_NEGATIVE = 4,
    SUB_ORBITAL = 5,
    DECAYED = 6
};

// ============================================================================
// SGP4 Exception Classes
// ============================================================================

/**
 * Base exception class for SGP4 propagation errors.
 * Carries the nonzero error code of the model.
 */
class SGP4Exception : public std::runtime_error {
public:
    SGP4Exception(ErrorCode code, const std::string& msg) : std::runtime_error(msg), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

/**
 * Exception thrown when a satellite has decayed (re-entered atmosphere).
 */
class SatelliteDecayedException : public SGP4Exception {
public:
    SatelliteDecayedException() : SGP4Exception(DECAYED, "Satellite has decayed") {}
};

/**
 * Exception thrown when orbital elements are invalid.
 */
class InvalidOrbitException : public SGP4Exception {
public:
    InvalidOrbitException(ErrorCode code, const std::string& msg) : SGP4Exception(code, msg) {}
};

// ============================================================================
// SGP4 Data Structures
// ============================================================================

/**
 * Record built once per satellite by initialize() and read by propagate().
 * Field names follow the published model so the equations can be checked
 * against it. Distances are in Earth radii and rates in radians per minute.
 */
struct State {
    bool initialized = false;

    // Element epoch as a whole and fractional Julian date
    double jdsatepoch = 0.0;
    double jdsatepochF = 0.0;

    // 'n' for periods under 225 minutes, 'd' for the deep space branch
    char method = 'n';
    // Perigee below 220 km or deep space, drops the higher order drag terms
    bool isimp = false;
    // 0 without resonance, 1 for one day and 2 for half day orbits
    int irez = 0;

    // Mean elements at epoch
    double a = 0.0;
    double argpo = 0.0;
    double bstar = 0.0;
    double ecco = 0.0;
    double inclo = 0.0;
    double mo = 0.0;
    double no_kozai = 0.0;
    double no_unkozai = 0.0;
    double nodeo = 0.0;
    double gsto = 0.0;

    // Secular rates and drag
    double aycof = 0.0, con41 = 0.0;
    double cc1 = 0.0, cc4 = 0.0, cc5 = 0.0;
    double d2 = 0.0, d3 = 0.0, d4 = 0.0;
    double delmo = 0.0, eta = 0.0, sinmao = 0.0;
    double argpdot = 0.0, mdot = 0.0, nodedot = 0.0;
    double omgcof = 0.0, xmcof = 0.0, nodecf = 0.0, xlcof = 0.0;
    double t2cof = 0.0, t3cof = 0.0, t4cof = 0.0, t5cof = 0.0;
    double x1mth2 = 0.0, x7thm1 = 0.0;

    // Lunar and solar periodics
    double e3 = 0.0, ee2 = 0.0;
    double se2 = 0.0, se3 = 0.0, sgh2 = 0.0, sgh3 = 0.0, sgh4 = 0.0;
    double sh2 = 0.0, sh3 = 0.0, si2 = 0.0, si3 = 0.0, sl2 = 0.0, sl3 = 0.0, sl4 = 0.0;
    double xgh2 = 0.0, xgh3 = 0.0, xgh4 = 0.0, xh2 = 0.0, xh3 = 0.0;
    double xi2 = 0.0, xi3 = 0.0, xl2 = 0.0, xl3 = 0.0, xl4 = 0.0;
    double zmol = 0.0, zmos = 0.0;

    // Resonance integrator, restarted from these values on every call
    double xlamo = 0.0, atime = 0.0, xli = 0.0, xni = 0.0;
    double d2201 = 0.0, d2211 = 0.0, d3210 = 0.0, d3222 = 0.0;
    double d4410 = 0.0, d4422 = 0.0, d5220 = 0.0, d5232 = 0.0, d5421 = 0.0, d5433 = 0.0;
    double del1 = 0.0, del2 = 0.0, del3 = 0.0, xfact = 0.0;
    double dedt = 0.0, didt = 0.0, dmdt = 0.0, dnodt = 0.0, domdt = 0.0;
};

/**
 * Mean elements decoded from a two-line element set. Angles in radians,
 * mean motion in radians per minute.
 */
struct Elements {
    double epoch_jd;
    double bstar;
    double inclination;
    double raan;
    double eccentricity;
    double arg_perigee;
    double mean_anomaly;
    double mean_motion;
};

/** TEME position (km) and velocity (km/s). */
struct Result {
    double r[3];
    double v[3];
};

// ============================================================================
// SGP4 Public API
// ============================================================================

/**
 * Initialize SGP4 state from orbital elements.
 * Must be called before propagate().
 *
 * @throws InvalidOrbitException if elements are invalid
 * @throws SatelliteDecayedException if satellite has decayed
 */
void initialize(State& state, const Elements& elements);

/**
 * Propagate to time since epoch.
 *
 * @param state The initialized SGP4 state (from initialize())
 * @param tsince Minutes since epoch
 * @throws InvalidOrbitException if propagation fails
 * @throws SatelliteDecayedException if satellite has decayed
 */
Result propagate(const State& state, double tsince);

/**
 * Greenwich Sidereal Time at a given Julian Date (radians).
 */
double gstime(double jdut1);

} // namespace orbitcast::sgp4

#endif // __ORBITCAST_SGP4_HPP

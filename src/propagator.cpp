/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <orbitcast/propagator.hpp>

#include <algorithm>
#include <chrono>
#include <cmath>

#include <spdlog/spdlog.h>

using spdlog::debug;

namespace orbitcast {

std::optional<PositionSample> toPositionSample(const Satellite &satellite,
                                               double x, double y, double z, double speed) {
    double r = std::sqrt(x*x + y*y + z*z);
    if (!std::isfinite(r) || !std::isfinite(speed) || r <= 0.0) {
        return std::nullopt;
    }

    // Spherical approximation, no rotation into an Earth-fixed frame
    double lon = std::atan2(y, x) * RADIANS_TO_DEGREES;
    if (lon <= -180.0) {
        lon += 360.0;
    }
    double lat = std::asin(std::clamp(z / r, -1.0, 1.0)) * RADIANS_TO_DEGREES;
    double alt = (r - EARTH_RADIUS_KM) * 1000.0;

    return PositionSample{
        .id = satellite.getID(),
        .name = satellite.getName(),
        .regime = satellite.getRegime(),
        .longitude = lon,
        .latitude = lat,
        .altitude = alt,
        .speed = speed
    };
}

// ============================================================================
// SGP4
// ============================================================================

std::optional<PositionSample> Sgp4Propagator::propagate(const Satellite &satellite, time_point t) const {
    if (!std::holds_alternative<TwoLineElements>(satellite.getElements())) {
        debug("SGP4 can't propagate {} without two-line elements", satellite.getID());
        return std::nullopt;
    }

    try {
        const sgp4::State &state = satellite.getSGP4State();

        // Time since epoch in minutes
        double tsince = (toJulianDate(t) - state.jdsatepoch - state.jdsatepochF) * MINUTES_PER_DAY;

        sgp4::Result result = sgp4::propagate(state, tsince);

        double speed = std::sqrt(result.v[0]*result.v[0] + result.v[1]*result.v[1] + result.v[2]*result.v[2]);
        auto sample = toPositionSample(satellite, result.r[0], result.r[1], result.r[2], speed);
        if (!sample) {
            debug("SGP4 returned a non-finite state for {}", satellite.getName());
        }
        return sample;
    } catch (const sgp4::SGP4Exception &e) {
        debug("Error propagating {} (code {}): {}", satellite.getName(), static_cast<int>(e.code()), e.what());
        return std::nullopt;
    }
}

std::string Sgp4Propagator::name() const {
    return "SGP4";
}

// ============================================================================
// Two-Body
// ============================================================================

double solveKepler(double meanAnomaly, double eccentricity, const KeplerSolverOptions &options) {
    double E = meanAnomaly;
    for (int i = 0; i < options.iterations; ++i) {
        double next = meanAnomaly + eccentricity * std::sin(E);
        bool converged = options.tolerance > 0.0 && std::abs(next - E) <= options.tolerance;
        E = next;
        if (converged) {
            break;
        }
    }
    return E;
}

TwoBodyPropagator::TwoBodyPropagator(KeplerSolverOptions options) : options(options) {}

const KeplerSolverOptions& TwoBodyPropagator::getOptions() const {
    return options;
}

std::optional<PositionSample> TwoBodyPropagator::propagate(const Satellite &satellite, time_point t) const {
    using namespace std::chrono;

    const auto *elements = std::get_if<KeplerianElements>(&satellite.getElements());
    if (elements == nullptr) {
        debug("Two-body model can't propagate {} without Keplerian elements", satellite.getID());
        return std::nullopt;
    }

    double a = elements->semiMajorAxis;
    double e = elements->eccentricity;
    double dt = duration_cast<duration<double>>(t - elements->epoch).count();

    // Mean anomaly at the target time
    double n = elements->meanMotion();
    double M = std::fmod(elements->trueAnomaly * DEGREES_TO_RADIANS + n * dt, 2.0 * M_PI);

    double E = solveKepler(M, e, options);

    // True anomaly and radius
    double nu = 2.0 * std::atan2(std::sqrt(1.0 + e) * std::sin(E / 2.0),
                                 std::sqrt(1.0 - e) * std::cos(E / 2.0));
    double r = a * (1.0 - e * std::cos(E));

    // Position in the orbital plane
    double xo = r * std::cos(nu);
    double yo = r * std::sin(nu);

    // Rotate by RAAN, inclination and argument of periapsis (3-1-3)
    double cosO = std::cos(elements->rightAscensionOfAscendingNode * DEGREES_TO_RADIANS);
    double sinO = std::sin(elements->rightAscensionOfAscendingNode * DEGREES_TO_RADIANS);
    double cosI = std::cos(elements->inclination * DEGREES_TO_RADIANS);
    double sinI = std::sin(elements->inclination * DEGREES_TO_RADIANS);
    double cosW = std::cos(elements->argumentOfPeriapsis * DEGREES_TO_RADIANS);
    double sinW = std::sin(elements->argumentOfPeriapsis * DEGREES_TO_RADIANS);

    double x = (cosO * cosW - sinO * sinW * cosI) * xo + (-cosO * sinW - sinO * cosW * cosI) * yo;
    double y = (sinO * cosW + cosO * sinW * cosI) * xo + (-sinO * sinW + cosO * cosW * cosI) * yo;
    double z = (sinW * sinI) * xo + (cosW * sinI) * yo;

    // Vis-viva
    double speed = std::sqrt(MU_EARTH * (2.0 / r - 1.0 / a));

    auto sample = toPositionSample(satellite, x, y, z, speed);
    if (!sample) {
        debug("Two-body model returned a non-finite state for {}", satellite.getName());
    }
    return sample;
}

std::string TwoBodyPropagator::name() const {
    return "Two-Body";
}

// ============================================================================
// Composite
// ============================================================================

CompositePropagator::CompositePropagator(KeplerSolverOptions options) : twoBody(options) {}

std::optional<PositionSample> CompositePropagator::propagate(const Satellite &satellite, time_point t) const {
    if (std::holds_alternative<TwoLineElements>(satellite.getElements())) {
        return sgp4.propagate(satellite, t);
    }
    return twoBody.propagate(satellite, t);
}

std::string CompositePropagator::name() const {
    return sgp4.name() + "/" + twoBody.name();
}

std::string CompositePropagator::nameFor(const SatelliteSet &satellites) const {
    if (satellites.empty()) {
        return name();
    }
    if (std::holds_alternative<TwoLineElements>(satellites.front().getElements())) {
        return sgp4.name();
    }
    return twoBody.name();
}

}

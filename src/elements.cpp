/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <orbitcast/elements.hpp>

#include <stdexcept>

namespace orbitcast {

double normalizeDegrees(double degrees) {
    double value = std::fmod(degrees, 360.0);
    if (value < 0) value += 360.0;
    // fmod of a tiny negative value can round back up to 360
    if (value >= 360.0) value = 0.0;
    return value;
}

std::ostream& operator<<(std::ostream &os, const OrbitRegime &regime) {
    switch (regime) {
        case OrbitRegime::LEO: os << "LEO"; break;
        case OrbitRegime::MEO: os << "MEO"; break;
        case OrbitRegime::GEO: os << "GEO"; break;
        case OrbitRegime::HEO: os << "HEO"; break;
    }
    return os;
}

std::string toString(OrbitRegime regime) {
    switch (regime) {
        case OrbitRegime::LEO: return "LEO";
        case OrbitRegime::MEO: return "MEO";
        case OrbitRegime::GEO: return "GEO";
        case OrbitRegime::HEO: return "HEO";
    }
    return "HEO";
}

OrbitRegime classify(double meanMotionRevPerDay, double eccentricity) {
    if (!(meanMotionRevPerDay > 0.0)) {
        return OrbitRegime::HEO;
    }

    return classifyPeriod(MINUTES_PER_DAY / meanMotionRevPerDay, eccentricity);
}

OrbitRegime classifyPeriod(double periodInMinutes, double eccentricity) {
    if (periodInMinutes < 128.0) {
        return OrbitRegime::LEO;
    } else if (periodInMinutes < 720.0) {
        return OrbitRegime::MEO;
    } else if (periodInMinutes > 1430.0 && periodInMinutes < 1450.0 && eccentricity < 0.01) {
        return OrbitRegime::GEO;
    }
    return OrbitRegime::HEO;
}

double KeplerianElements::meanMotion() const {
    return std::sqrt(MU_EARTH / (semiMajorAxis * semiMajorAxis * semiMajorAxis));
}

double KeplerianElements::period() const {
    return 2.0 * M_PI * std::sqrt(semiMajorAxis * semiMajorAxis * semiMajorAxis / MU_EARTH) / 60.0;
}

double KeplerianElements::revolutionsPerDay() const {
    return MINUTES_PER_DAY / period();
}

OrbitRegime classify(const TwoLineElements &elements) {
    return classify(elements.meanMotion, elements.eccentricity);
}

OrbitRegime classify(const KeplerianElements &elements) {
    if (!(elements.semiMajorAxis > 0.0)) {
        return OrbitRegime::HEO;
    }
    return classify(elements.revolutionsPerDay(), elements.eccentricity);
}

OrbitRegime classify(const ElementSet &elements) {
    return std::visit([](const auto &e) { return classify(e); }, elements);
}

Satellite::Satellite(std::string id, std::string name, ElementSet elements)
    : id(std::move(id)), name(std::move(name)), regime(classify(elements)), elements(std::move(elements)) {}

Satellite::Satellite(std::string id, std::string name, ElementSet elements,
                     std::string status, time_point launchDate)
    : id(std::move(id)), name(std::move(name)), regime(classify(elements)), elements(std::move(elements)),
      status(std::move(status)), launchDate(launchDate) {}

std::string Satellite::getID() const {
    return id;
}

std::string Satellite::getName() const {
    return name;
}

OrbitRegime Satellite::getRegime() const {
    return regime;
}

const ElementSet& Satellite::getElements() const {
    return elements;
}

std::optional<std::string> Satellite::getStatus() const {
    return status;
}

std::optional<time_point> Satellite::getLaunchDate() const {
    return launchDate;
}

const sgp4::State& Satellite::getSGP4State() const {
    if (!sgp4State_) {
        const auto *tle = std::get_if<TwoLineElements>(&elements);
        if (tle == nullptr) {
            throw std::logic_error("Satellite " + id + " has no two-line elements");
        }

        sgp4::Elements input{
            .epoch_jd = toJulianDate(tle->epoch),
            .bstar = tle->bstarDragTerm,
            .inclination = tle->inclination * DEGREES_TO_RADIANS,
            .raan = tle->rightAscensionOfAscendingNode * DEGREES_TO_RADIANS,
            .eccentricity = tle->eccentricity,
            .arg_perigee = tle->argumentOfPerigee * DEGREES_TO_RADIANS,
            .mean_anomaly = tle->meanAnomaly * DEGREES_TO_RADIANS,
            .mean_motion = tle->meanMotion * sgp4::TWO_PI / MINUTES_PER_DAY
        };

        sgp4::State state;
        sgp4::initialize(state, input);
        sgp4State_ = state;
    }
    return *sgp4State_;
}

// Convert a time_point to Julian Date
double toJulianDate(time_point tp) {
    using namespace std::chrono;

    auto daysSinceEpoch = duration_cast<duration<double, days::period>>(
        tp.time_since_epoch()
    ).count();

    // Unix epoch (1970-01-01) in Julian Date is 2440587.5
    return 2440587.5 + daysSinceEpoch;
}

}

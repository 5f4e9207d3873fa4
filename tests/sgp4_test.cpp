/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <orbitcast/sgp4.hpp>
#include <orbitcast/tle.hpp>

#include <cmath>

namespace orbitcast {
namespace {

// Vanguard 1, the first record of the SGP4 verification set
constexpr const char* VANGUARD_LINE1 = "1 00005U 58002B   00179.78495062  .00000023  00000-0  28098-4 0  4753";
constexpr const char* VANGUARD_LINE2 = "2 00005  34.2682 348.7242 1859667 331.7664  19.3264 10.82419157413667";

// ISS TLE data from Celestrak (real example)
constexpr const char* ISS_LINE1 = "1 25544U 98067A   25333.83453771  .00008010  00000+0  15237-3 0  9993";
constexpr const char* ISS_LINE2 = "2 25544  51.6312 206.3646 0003723 184.1118 175.9840 15.49193835540850";

// GPS satellite, 12 hour orbit handled by the deep space branch
constexpr const char* GPS_LINE1 = "1 28874U 05038A   25333.50000000 -.00000021  00000+0  00000+0 0  9991";
constexpr const char* GPS_LINE2 = "2 28874  55.4610 120.3456 0094857  45.1234 315.6789  2.00563112148571";

double magnitude(const double v[3]) {
    return std::sqrt(v[0]*v[0] + v[1]*v[1] + v[2]*v[2]);
}

sgp4::Elements validElements() {
    return sgp4::Elements{
        .epoch_jd = 2451545.0,
        .bstar = 0.0,
        .inclination = 51.6 * DEGREES_TO_RADIANS,
        .raan = 0.0,
        .eccentricity = 0.001,
        .arg_perigee = 0.0,
        .mean_anomaly = 0.0,
        .mean_motion = 15.5 * sgp4::TWO_PI / MINUTES_PER_DAY
    };
}

TEST(SGP4Test, VanguardAtEpoch) {
    auto satellite = parseTwoLineElements("VANGUARD 1", VANGUARD_LINE1, VANGUARD_LINE2);
    auto result = sgp4::propagate(satellite.getSGP4State(), 0.0);

    EXPECT_NEAR(result.r[0], 7022.46529266, 1.0);
    EXPECT_NEAR(result.r[1], -1400.08296755, 1.0);
    EXPECT_NEAR(result.r[2], 0.03995155, 1.0);
    EXPECT_NEAR(result.v[0], 1.893841015, 0.01);
    EXPECT_NEAR(result.v[1], 6.405893759, 0.01);
    EXPECT_NEAR(result.v[2], 4.534807250, 0.01);
}

TEST(SGP4Test, VanguardAfterSixHours) {
    auto satellite = parseTwoLineElements("VANGUARD 1", VANGUARD_LINE1, VANGUARD_LINE2);
    auto result = sgp4::propagate(satellite.getSGP4State(), 360.0);

    EXPECT_NEAR(result.r[0], -7154.03120202, 1.0);
    EXPECT_NEAR(result.r[1], -3783.17682504, 1.0);
    EXPECT_NEAR(result.r[2], -3536.19412294, 1.0);
    EXPECT_NEAR(result.v[0], 4.741887409, 0.01);
    EXPECT_NEAR(result.v[1], -4.151817765, 0.01);
    EXPECT_NEAR(result.v[2], -2.093935425, 0.01);
}

TEST(SGP4Test, ISSStaysInLowEarthOrbit) {
    auto satellite = parseTwoLineElements("ISS (ZARYA)", ISS_LINE1, ISS_LINE2);
    for (double tsince : {0.0, 45.0, 90.0, 1440.0}) {
        auto result = sgp4::propagate(satellite.getSGP4State(), tsince);
        double r = magnitude(result.r);
        EXPECT_GT(r, 6700.0) << "tsince " << tsince;
        EXPECT_LT(r, 6850.0) << "tsince " << tsince;
        EXPECT_NEAR(magnitude(result.v), 7.66, 0.1) << "tsince " << tsince;
    }
}

TEST(SGP4Test, DeepSpaceGPS) {
    auto satellite = parseTwoLineElements("GPS", GPS_LINE1, GPS_LINE2);
    for (double tsince : {0.0, 360.0, 720.0}) {
        auto result = sgp4::propagate(satellite.getSGP4State(), tsince);
        double r = magnitude(result.r);
        EXPECT_TRUE(std::isfinite(r));
        EXPECT_GT(r, 25500.0) << "tsince " << tsince;
        EXPECT_LT(r, 27500.0) << "tsince " << tsince;
        EXPECT_NEAR(magnitude(result.v), 3.87, 0.1) << "tsince " << tsince;
    }
}

TEST(SGP4Test, StateSplitsEpoch) {
    sgp4::State state;
    sgp4::initialize(state, validElements());
    EXPECT_TRUE(state.initialized);
    EXPECT_DOUBLE_EQ(state.jdsatepoch + state.jdsatepochF, 2451545.0);
    EXPECT_DOUBLE_EQ(state.jdsatepoch, 2451545.0);
}

TEST(SGP4Test, RejectsNonPositiveMeanMotion) {
    auto elements = validElements();
    elements.mean_motion = 0.0;
    sgp4::State state;
    try {
        sgp4::initialize(state, elements);
        FAIL() << "Expected InvalidOrbitException";
    } catch (const sgp4::InvalidOrbitException &e) {
        EXPECT_EQ(e.code(), sgp4::MEAN_MOTION_NOT_POSITIVE);
    }
}

TEST(SGP4Test, RejectsHyperbolicEccentricity) {
    auto elements = validElements();
    elements.eccentricity = 1.2;
    sgp4::State state;
    EXPECT_THROW(sgp4::initialize(state, elements), sgp4::InvalidOrbitException);
}

TEST(SGP4Test, RejectsSubOrbitalElements) {
    auto elements = validElements();
    elements.eccentricity = 0.5;
    sgp4::State state;
    EXPECT_THROW(sgp4::initialize(state, elements), sgp4::SGP4Exception);
}

TEST(SGP4Test, GreenwichSiderealTimeAtJ2000) {
    // 280.46061837 degrees at 2000-01-01 12:00 UT1
    EXPECT_NEAR(sgp4::gstime(2451545.0), 280.46061837 * DEGREES_TO_RADIANS, 1e-6);
}

}
}

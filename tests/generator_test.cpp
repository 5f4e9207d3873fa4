/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <orbitcast/generator.hpp>

#include <chrono>
#include <cmath>
#include <set>
#include <string>

namespace orbitcast {
namespace {

const KeplerianElements& elementsOf(const Satellite &satellite) {
    return std::get<KeplerianElements>(satellite.getElements());
}

class GeneratorTest : public ::testing::Test {
protected:
    time_point epoch = std::chrono::sys_days{std::chrono::year{2025}/std::chrono::March/1};
    WalkerParameters gps{.planes = 6, .satellitesPerPlane = 4, .altitude = 20200.0,
                         .inclination = 55.0, .regime = OrbitRegime::MEO};
    WalkerParameters iridium{.planes = 6, .satellitesPerPlane = 11, .altitude = 780.0,
                             .inclination = 86.4, .regime = OrbitRegime::LEO};
};

TEST(WalkerParametersTest, Total) {
    EXPECT_EQ((WalkerParameters{.planes = 6, .satellitesPerPlane = 4}).total(), 24);
    EXPECT_EQ((WalkerParameters{.planes = 72, .satellitesPerPlane = 22}).total(), 1584);
    EXPECT_EQ((WalkerParameters{.planes = 0, .satellitesPerPlane = 4}).total(), 0);
    EXPECT_EQ((WalkerParameters{.planes = 6, .satellitesPerPlane = -1}).total(), 0);
}

TEST_F(GeneratorTest, GeneratesEverySatellite) {
    ConstellationGenerator generator;
    EXPECT_EQ(generator.generate("gps-constellation", gps, epoch).size(), 24);
    EXPECT_EQ(generator.generate("iridium-constellation", iridium, epoch).size(), 66);
}

TEST_F(GeneratorTest, IdsAndNames) {
    ConstellationGenerator generator;
    auto satellites = generator.generate("gps-constellation", gps, epoch);
    ASSERT_EQ(satellites.size(), 24);
    EXPECT_EQ(satellites.front().getID(), "gps-constellation-P01-S01");
    EXPECT_EQ(satellites.front().getName(), "GPS-CONSTELLATION P1-S1");
    EXPECT_EQ(satellites[5].getID(), "gps-constellation-P02-S02");
    EXPECT_EQ(satellites.back().getID(), "gps-constellation-P06-S04");
    EXPECT_EQ(satellites.back().getName(), "GPS-CONSTELLATION P6-S4");
}

TEST_F(GeneratorTest, IdsAreUnique) {
    ConstellationGenerator generator;
    auto satellites = generator.generate("iridium-constellation", iridium, epoch);
    std::set<std::string> ids;
    for (const auto &satellite : satellites) {
        ids.insert(satellite.getID());
    }
    EXPECT_EQ(ids.size(), satellites.size());
}

TEST_F(GeneratorTest, PlaneGeometry) {
    ConstellationGenerator generator;
    auto satellites = generator.generate("gps-constellation", gps, epoch);
    for (int p = 0; p < gps.planes; ++p) {
        for (int s = 0; s < gps.satellitesPerPlane; ++s) {
            const auto &elements = elementsOf(satellites[p * gps.satellitesPerPlane + s]);
            EXPECT_DOUBLE_EQ(elements.rightAscensionOfAscendingNode, 360.0 * p / gps.planes);
            EXPECT_DOUBLE_EQ(elements.semiMajorAxis, EARTH_RADIUS_KM + 20200.0);
            EXPECT_NEAR(elements.inclination, 55.0, 0.5);
            EXPECT_GE(elements.eccentricity, 0.001);
            EXPECT_LT(elements.eccentricity, 0.006);
            EXPECT_GE(elements.argumentOfPeriapsis, 0.0);
            EXPECT_LT(elements.argumentOfPeriapsis, 360.0);
            EXPECT_EQ(elements.epoch, epoch);
        }
    }
}

TEST_F(GeneratorTest, PhaseSpacingWithinPlane) {
    ConstellationGenerator generator;
    auto satellites = generator.generate("gps-constellation", gps, epoch);
    // Plane 2 is offset by 360 / (P * S) = 15 degrees
    for (int s = 0; s < gps.satellitesPerPlane; ++s) {
        EXPECT_NEAR(elementsOf(satellites[s]).trueAnomaly, 90.0 * s, 1e-9);
        EXPECT_NEAR(elementsOf(satellites[gps.satellitesPerPlane + s]).trueAnomaly, 90.0 * s + 15.0, 1e-9);
    }
}

TEST_F(GeneratorTest, PhaseWrapsIntoRange) {
    ConstellationGenerator generator;
    for (const auto &satellite : generator.generate("iridium-constellation", iridium, epoch)) {
        EXPECT_GE(elementsOf(satellite).trueAnomaly, 0.0);
        EXPECT_LT(elementsOf(satellite).trueAnomaly, 360.0);
    }
}

TEST_F(GeneratorTest, GeneratedFields) {
    ConstellationGenerator generator;
    auto satellites = generator.generate("gps-constellation", gps, epoch);
    for (const auto &satellite : satellites) {
        ASSERT_TRUE(satellite.getStatus().has_value());
        EXPECT_EQ(*satellite.getStatus(), "active");
        ASSERT_TRUE(satellite.getLaunchDate().has_value());
        EXPECT_EQ(*satellite.getLaunchDate(), epoch);
        EXPECT_EQ(satellite.getRegime(), OrbitRegime::MEO);
    }
}

TEST_F(GeneratorTest, RegimeIsDerivedNotNominal) {
    ConstellationGenerator generator;
    WalkerParameters galileo{.planes = 3, .satellitesPerPlane = 8, .altitude = 23222.0,
                             .inclination = 56.0, .regime = OrbitRegime::MEO};
    auto satellites = generator.generate("galileo-constellation", galileo, epoch);
    ASSERT_EQ(satellites.size(), 24);
    // A 844 minute period is beyond the MEO window
    EXPECT_EQ(satellites.front().getRegime(), OrbitRegime::HEO);
}

TEST_F(GeneratorTest, EmptyForNonPositiveCounts) {
    ConstellationGenerator generator;
    WalkerParameters none{.planes = 0, .satellitesPerPlane = 4, .altitude = 550.0, .inclination = 53.0};
    WalkerParameters negative{.planes = 3, .satellitesPerPlane = -2, .altitude = 550.0, .inclination = 53.0};
    EXPECT_TRUE(generator.generate("none", none, epoch).empty());
    EXPECT_TRUE(generator.generate("negative", negative, epoch).empty());
}

TEST_F(GeneratorTest, DeterministicGeneration) {
    ConstellationGenerator first(true);
    ConstellationGenerator second(true);
    EXPECT_TRUE(first.isDeterministic());

    auto a = first.generate("gps-constellation", gps, epoch);
    auto b = second.generate("gps-constellation", gps, epoch);
    // The same generator reseeds for every call
    auto c = first.generate("gps-constellation", gps, epoch);

    ASSERT_EQ(a.size(), b.size());
    ASSERT_EQ(a.size(), c.size());
    for (std::size_t i = 0; i < a.size(); ++i) {
        EXPECT_DOUBLE_EQ(elementsOf(a[i]).eccentricity, elementsOf(b[i]).eccentricity);
        EXPECT_DOUBLE_EQ(elementsOf(a[i]).inclination, elementsOf(b[i]).inclination);
        EXPECT_DOUBLE_EQ(elementsOf(a[i]).argumentOfPeriapsis, elementsOf(b[i]).argumentOfPeriapsis);
        EXPECT_DOUBLE_EQ(elementsOf(a[i]).eccentricity, elementsOf(c[i]).eccentricity);
    }
}

TEST(ConstellationGeneratorTest, SeedDependsOnPrefix) {
    EXPECT_EQ(ConstellationGenerator::seedFor("gps-constellation"),
              ConstellationGenerator::seedFor("gps-constellation"));
    EXPECT_FALSE(ConstellationGenerator().isDeterministic());
}

}
}

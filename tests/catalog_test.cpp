/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <orbitcast/catalog.hpp>

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

namespace orbitcast {
namespace {

using namespace std::chrono_literals;

// Two stations as served for GROUP=stations
constexpr const char* STATIONS_TLE =
    "ISS (ZARYA)\n"
    "1 25544U 98067A   25333.83453771  .00008010  00000+0  15237-3 0  9993\n"
    "2 25544  51.6312 206.3646 0003723 184.1118 175.9840 15.49193835540850\n"
    "NOAA 19\n"
    "1 33591U 09005A   25333.78204194  .00000054  00000+0  52635-4 0  9999\n"
    "2 33591  98.9785  39.2910 0013037 231.6546 128.3455 14.13431889866318\n";

class CatalogTest : public ::testing::Test {
protected:
    time_point now = std::chrono::sys_days{std::chrono::year{2025}/std::chrono::December/1};
    Clock clock = [this] { return now; };

    ScenarioRegistry registry = ScenarioRegistry::withDefaults(now);
    SatelliteCache cache{3600s, clock};
    ConstellationGenerator generator{true};
    std::vector<std::string> requests;
    bool failDownloads = false;

    Catalog catalog{registry, cache, generator, [this](const std::string &url) {
        requests.push_back(url);
        if (failDownloads) {
            throw std::runtime_error("Connection refused");
        }
        return std::string(STATIONS_TLE);
    }, clock};
};

TEST_F(CatalogTest, DownloadsAndParses) {
    auto satellites = catalog.materialize("space-stations");
    ASSERT_EQ(satellites->size(), 2);
    EXPECT_EQ((*satellites)[0].getName(), "ISS (ZARYA)");
    ASSERT_EQ(requests.size(), 1);
    EXPECT_EQ(requests[0], "https://celestrak.org/NORAD/elements/gp.php?GROUP=stations&FORMAT=tle");
}

TEST_F(CatalogTest, RefreshesScenarioCount) {
    EXPECT_EQ(registry.find("space-stations")->satelliteCount, 0);
    catalog.materialize("space-stations");
    EXPECT_EQ(registry.find("space-stations")->satelliteCount, 2);
}

TEST_F(CatalogTest, CachedSetIsReused) {
    auto first = catalog.materialize("space-stations");
    now += 30min;
    auto second = catalog.materialize("space-stations");
    EXPECT_EQ(first.get(), second.get());
    EXPECT_EQ(requests.size(), 1);
}

TEST_F(CatalogTest, ExpiredSetIsFetchedAgain) {
    catalog.materialize("space-stations");
    now += 1h;
    catalog.materialize("space-stations");
    EXPECT_EQ(requests.size(), 2);
}

TEST_F(CatalogTest, FailedDownloadYieldsEmptySet) {
    failDownloads = true;
    auto satellites = catalog.materialize("gps");
    ASSERT_NE(satellites, nullptr);
    EXPECT_TRUE(satellites->empty());
    EXPECT_EQ(cache.size(), 0);
    EXPECT_EQ(registry.find("gps")->satelliteCount, 0);
}

TEST_F(CatalogTest, FailedDownloadIsRetried) {
    failDownloads = true;
    catalog.materialize("gps");
    failDownloads = false;
    auto satellites = catalog.materialize("gps");
    EXPECT_EQ(satellites->size(), 2);
    EXPECT_EQ(requests.size(), 2);
}

TEST_F(CatalogTest, UnknownScenarioYieldsEmptySet) {
    auto satellites = catalog.materialize("nonexistent");
    ASSERT_NE(satellites, nullptr);
    EXPECT_TRUE(satellites->empty());
    EXPECT_TRUE(requests.empty());
    EXPECT_EQ(cache.size(), 0);
}

TEST_F(CatalogTest, GeneratedScenario) {
    auto satellites = catalog.materialize("gps-constellation");
    ASSERT_EQ(satellites->size(), 24);
    EXPECT_TRUE(requests.empty());
    EXPECT_EQ((*satellites)[0].getID(), "gps-constellation-P01-S01");
    ASSERT_TRUE((*satellites)[0].getLaunchDate().has_value());
    EXPECT_EQ(*(*satellites)[0].getLaunchDate(), now);
    EXPECT_EQ(registry.find("gps-constellation")->satelliteCount, 24);
}

TEST_F(CatalogTest, GeneratedScenarioIsCached) {
    auto first = catalog.materialize("iridium-constellation");
    auto second = catalog.materialize("iridium-constellation");
    EXPECT_EQ(first.get(), second.get());
    EXPECT_EQ(cache.size(), 1);
}

TEST_F(CatalogTest, DataSource) {
    EXPECT_EQ(catalog.dataSource("gps"), "CelesTrak");
    EXPECT_EQ(catalog.dataSource("gps-constellation"), "Walker Generator");
}

TEST(CatalogWithoutFetcherTest, DownloadFailsCleanly) {
    ScenarioRegistry registry = ScenarioRegistry::withDefaults(std::chrono::system_clock::now());
    SatelliteCache cache;
    ConstellationGenerator generator;
    Catalog catalog(registry, cache, generator, nullptr);
    EXPECT_TRUE(catalog.materialize("gps")->empty());
    EXPECT_EQ(catalog.materialize("gps-constellation")->size(), 24);
}

}
}

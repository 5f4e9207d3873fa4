/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <orbitcast/delivery.hpp>

#include <chrono>
#include <climits>
#include <cmath>
#include <string>
#include <vector>

namespace orbitcast {
namespace {

using namespace std::chrono_literals;

constexpr const char* STATIONS_TLE =
    "ISS (ZARYA)\n"
    "1 25544U 98067A   25333.83453771  .00008010  00000+0  15237-3 0  9993\n"
    "2 25544  51.6312 206.3646 0003723 184.1118 175.9840 15.49193835540850\n"
    "NOAA 19\n"
    "1 33591U 09005A   25333.78204194  .00000054  00000+0  52635-4 0  9999\n"
    "2 33591  98.9785  39.2910 0013037 231.6546 128.3455 14.13431889866318\n";

class DeliveryTest : public ::testing::Test {
protected:
    time_point now = std::chrono::sys_days{std::chrono::year{2025}/std::chrono::December/1};
    Clock clock = [this] { return now; };

    Config config;
    ScenarioRegistry registry = ScenarioRegistry::withDefaults(now);
    SatelliteCache cache{3600s, clock};
    ConstellationGenerator generator{true};
    int downloads = 0;

    Catalog catalog{registry, cache, generator, [this](const std::string &) {
        ++downloads;
        return std::string(STATIONS_TLE);
    }, clock};

    PositionService service{catalog, config, clock};

    std::vector<std::string> idsOf(const std::vector<PositionSample> &samples) {
        std::vector<std::string> ids;
        for (const auto &sample : samples) {
            ids.push_back(sample.id);
        }
        return ids;
    }
};

// ============================================================================
// Scenarios and Satellites
// ============================================================================

TEST_F(DeliveryTest, ListScenarios) {
    EXPECT_EQ(service.listScenarios().size(), 11);
    EXPECT_EQ(downloads, 0);
}

TEST_F(DeliveryTest, GetScenarioRefreshesDownloadedCount) {
    auto scenario = service.getScenario("space-stations");
    ASSERT_TRUE(scenario.has_value());
    EXPECT_EQ(scenario->satelliteCount, 2);
    EXPECT_EQ(downloads, 1);
}

TEST_F(DeliveryTest, GetScenarioDoesNotGenerate) {
    auto scenario = service.getScenario("starlink-shell");
    ASSERT_TRUE(scenario.has_value());
    EXPECT_EQ(scenario->satelliteCount, 1584);
    EXPECT_EQ(cache.size(), 0);
}

TEST_F(DeliveryTest, GetUnknownScenario) {
    EXPECT_FALSE(service.getScenario("nonexistent").has_value());
}

TEST_F(DeliveryTest, SatelliteListing) {
    auto listing = service.satellites("space-stations");
    EXPECT_EQ(listing.scenarioID, "space-stations");
    ASSERT_EQ(listing.satellites.size(), 2);
    EXPECT_EQ(listing.satellites[0].id, "25544");
    EXPECT_EQ(listing.satellites[0].name, "ISS (ZARYA)");
    EXPECT_EQ(listing.satellites[0].regime, OrbitRegime::LEO);
    EXPECT_EQ(listing.dataSource, "CelesTrak");
    EXPECT_GE(listing.fetchTimeMs, 0.0);
}

TEST_F(DeliveryTest, SatelliteListingForUnknownScenarioIsEmpty) {
    auto listing = service.satellites("nonexistent");
    EXPECT_TRUE(listing.satellites.empty());
}

// ============================================================================
// Positions
// ============================================================================

TEST_F(DeliveryTest, PositionsOfGeneratedScenario) {
    auto batch = service.positions("gps-constellation", 0.0);
    EXPECT_EQ(batch.scenarioID, "gps-constellation");
    EXPECT_EQ(batch.samples.size(), 24);
    EXPECT_EQ(batch.timestamp, now);
    EXPECT_EQ(batch.propagator, "Two-Body");
    EXPECT_EQ(batch.dataSource, "Walker Generator");
    EXPECT_FALSE(batch.chunk.has_value());
    for (const auto &sample : batch.samples) {
        EXPECT_NEAR(sample.altitude / 1000.0, 20200.0, 200.0);
        EXPECT_GT(sample.longitude, -180.0);
        EXPECT_LE(sample.longitude, 180.0);
        EXPECT_GE(sample.latitude, -90.0);
        EXPECT_LE(sample.latitude, 90.0);
    }
}

TEST_F(DeliveryTest, PositionsOfDownloadedScenario) {
    auto batch = service.positions("space-stations", 0.0);
    EXPECT_EQ(batch.samples.size(), 2);
    EXPECT_EQ(batch.propagator, "SGP4");
    EXPECT_EQ(batch.dataSource, "CelesTrak");
}

TEST_F(DeliveryTest, PositionsAtOffset) {
    auto batch = service.positions("gps-constellation", 3600.0);
    EXPECT_EQ(batch.timestamp, now + 1h);
    EXPECT_DOUBLE_EQ(batch.timeOffset, 3600.0);

    auto past = service.positions("gps-constellation", -1800.0);
    EXPECT_EQ(past.timestamp, now - 30min);
}

TEST_F(DeliveryTest, PositionsMove) {
    auto start = service.positions("iridium-constellation", 0.0);
    auto later = service.positions("iridium-constellation", 600.0);
    ASSERT_EQ(start.samples.size(), later.samples.size());
    EXPECT_NE(start.samples[0].latitude, later.samples[0].latitude);
}

TEST_F(DeliveryTest, PositionsLimit) {
    auto batch = service.positions("iridium-constellation", 0.0, 10);
    ASSERT_EQ(batch.samples.size(), 10);
    EXPECT_EQ(batch.samples[0].id, "iridium-constellation-P01-S01");

    EXPECT_EQ(service.positions("iridium-constellation", 0.0, 1000).samples.size(), 66);
}

TEST_F(DeliveryTest, NonPositiveLimitKeepsEverySatellite) {
    EXPECT_EQ(service.positions("iridium-constellation", 0.0, 0).samples.size(), 66);
    EXPECT_EQ(service.positions("iridium-constellation", 0.0, -5).samples.size(), 66);

    auto chunk = service.positions("iridium-constellation", 0.0, 20, 0, 0);
    ASSERT_TRUE(chunk.chunk.has_value());
    EXPECT_EQ(chunk.chunk->totalSatellites, 66);
    EXPECT_EQ(chunk.chunk->totalChunks, 4);
}

TEST_F(DeliveryTest, ChunksReconstructTheSet) {
    auto full = service.positions("iridium-constellation", 0.0);

    std::vector<std::string> ids;
    int totalChunks = 0;
    int index = 0;
    do {
        auto chunk = service.positions("iridium-constellation", 0.0, 20, index);
        ASSERT_TRUE(chunk.chunk.has_value());
        EXPECT_EQ(chunk.chunk->chunkIndex, index);
        EXPECT_EQ(chunk.chunk->chunkSize, 20);
        EXPECT_EQ(chunk.chunk->totalSatellites, 66);
        totalChunks = chunk.chunk->totalChunks;
        auto chunkIDs = idsOf(chunk.samples);
        ids.insert(ids.end(), chunkIDs.begin(), chunkIDs.end());
        ++index;
    } while (index < totalChunks);

    EXPECT_EQ(totalChunks, 4);
    EXPECT_EQ(ids, idsOf(full.samples));
}

TEST_F(DeliveryTest, LastChunkIsPartial) {
    auto chunk = service.positions("iridium-constellation", 0.0, 20, 3);
    EXPECT_EQ(chunk.samples.size(), 6);
    EXPECT_EQ(chunk.samples[0].id, "iridium-constellation-P06-S06");
}

TEST_F(DeliveryTest, OutOfRangeChunkIsEmpty) {
    auto chunk = service.positions("iridium-constellation", 0.0, 20, 4);
    EXPECT_TRUE(chunk.samples.empty());
    ASSERT_TRUE(chunk.chunk.has_value());
    EXPECT_EQ(chunk.chunk->totalChunks, 4);

    EXPECT_TRUE(service.positions("iridium-constellation", 0.0, 20, -1).samples.empty());
}

TEST_F(DeliveryTest, LimitAppliesBeforeChunking) {
    auto chunk = service.positions("iridium-constellation", 0.0, 4, 2, 10);
    ASSERT_TRUE(chunk.chunk.has_value());
    EXPECT_EQ(chunk.chunk->totalSatellites, 10);
    EXPECT_EQ(chunk.chunk->totalChunks, 3);
    ASSERT_EQ(chunk.samples.size(), 2);
    EXPECT_EQ(chunk.samples[0].id, "iridium-constellation-P01-S09");
}

TEST_F(DeliveryTest, LargestChunkSizeHoldsTheWholeSet) {
    auto chunk = service.positions("gps-constellation", 0.0, INT_MAX, 0);
    ASSERT_TRUE(chunk.chunk.has_value());
    EXPECT_EQ(chunk.chunk->chunkSize, INT_MAX);
    EXPECT_EQ(chunk.chunk->totalChunks, 1);
    EXPECT_EQ(chunk.chunk->totalSatellites, 24);
    EXPECT_EQ(chunk.samples.size(), 24);

    EXPECT_TRUE(service.positions("gps-constellation", 0.0, INT_MAX, 1).samples.empty());
}

TEST_F(DeliveryTest, NonPositiveChunkSizeIsUnchunked) {
    auto batch = service.positions("gps-constellation", 0.0, 0, 3);
    EXPECT_FALSE(batch.chunk.has_value());
    EXPECT_EQ(batch.samples.size(), 24);
}

TEST_F(DeliveryTest, PositionsOfUnknownScenario) {
    auto batch = service.positions("nonexistent", 0.0);
    EXPECT_TRUE(batch.samples.empty());
    EXPECT_EQ(batch.propagator, "SGP4/Two-Body");

    auto chunk = service.positions("nonexistent", 0.0, 10, 0);
    ASSERT_TRUE(chunk.chunk.has_value());
    EXPECT_EQ(chunk.chunk->totalChunks, 0);
    EXPECT_TRUE(chunk.samples.empty());
}

// ============================================================================
// Compare
// ============================================================================

TEST(CompareMetricTest, Parse) {
    EXPECT_EQ(parseMetric("count"), CompareMetric::COUNT);
    EXPECT_EQ(parseMetric("altitude"), CompareMetric::ALTITUDE);
    EXPECT_EQ(parseMetric("velocity"), CompareMetric::VELOCITY);
    EXPECT_EQ(parseMetric("coverage"), CompareMetric::COVERAGE);
    EXPECT_EQ(parseMetric("bogus"), CompareMetric::COUNT);
    EXPECT_EQ(toString(CompareMetric::COVERAGE), "coverage");
}

TEST_F(DeliveryTest, CompareByCount) {
    auto comparison = service.compare("gps-constellation, iridium-constellation,nonexistent", "count");
    EXPECT_EQ(comparison.metric, CompareMetric::COUNT);
    ASSERT_EQ(comparison.scenarios.size(), 2);

    EXPECT_EQ(comparison.scenarios[0].first, "gps-constellation");
    const auto &gps = std::get<CountSummary>(comparison.scenarios[0].second);
    EXPECT_EQ(gps.satelliteCount, 24);
    EXPECT_EQ(gps.name, "GPS Walker Constellation");

    EXPECT_EQ(comparison.scenarios[1].first, "iridium-constellation");
    EXPECT_EQ(std::get<CountSummary>(comparison.scenarios[1].second).satelliteCount, 66);
}

TEST_F(DeliveryTest, CompareCountRefreshesDownloadedScenario) {
    auto comparison = service.compare("space-stations", "count");
    ASSERT_EQ(comparison.scenarios.size(), 1);
    EXPECT_EQ(std::get<CountSummary>(comparison.scenarios[0].second).satelliteCount, 2);
}

TEST_F(DeliveryTest, CompareByAltitude) {
    auto comparison = service.compare("gps-constellation,iridium-constellation", "altitude");
    EXPECT_EQ(comparison.metric, CompareMetric::ALTITUDE);
    ASSERT_EQ(comparison.scenarios.size(), 2);

    const auto &gps = std::get<RangeSummary>(comparison.scenarios[0].second);
    EXPECT_EQ(gps.unit, "km");
    EXPECT_NEAR(gps.mean, 20200.0, 200.0);
    EXPECT_LE(gps.min, gps.mean);
    EXPECT_GE(gps.max, gps.mean);

    const auto &iridium = std::get<RangeSummary>(comparison.scenarios[1].second);
    EXPECT_NEAR(iridium.mean, 780.0, 50.0);
}

TEST_F(DeliveryTest, CompareByVelocity) {
    auto comparison = service.compare("gps-constellation", "velocity");
    ASSERT_EQ(comparison.scenarios.size(), 1);
    const auto &gps = std::get<RangeSummary>(comparison.scenarios[0].second);
    EXPECT_EQ(gps.unit, "km/s");
    EXPECT_NEAR(gps.mean, 3.87, 0.05);
}

TEST_F(DeliveryTest, CompareByCoverage) {
    auto comparison = service.compare("iridium-constellation", "coverage");
    ASSERT_EQ(comparison.scenarios.size(), 1);
    const auto &iridium = std::get<CoverageSummary>(comparison.scenarios[0].second);
    EXPECT_EQ(iridium.satelliteCount, 66);
    EXPECT_GT(iridium.latitudeCoverage, 0.0);
    EXPECT_LE(iridium.latitudeCoverage, 180.0);
}

TEST_F(DeliveryTest, CompareSampleLimit) {
    config.setCompareSampleLimit(10);
    auto comparison = service.compare("iridium-constellation", "coverage");
    ASSERT_EQ(comparison.scenarios.size(), 1);
    EXPECT_EQ(std::get<CoverageSummary>(comparison.scenarios[0].second).satelliteCount, 10);
}

TEST_F(DeliveryTest, CompareUnknownMetricFallsBackToCount) {
    auto comparison = service.compare("gps-constellation", "brightness");
    EXPECT_EQ(comparison.metric, CompareMetric::COUNT);
    ASSERT_EQ(comparison.scenarios.size(), 1);
    EXPECT_TRUE(std::holds_alternative<CountSummary>(comparison.scenarios[0].second));
}

TEST_F(DeliveryTest, CompareSkipsEmptyScenarios) {
    auto comparison = service.compare("nonexistent, ,", "altitude");
    EXPECT_TRUE(comparison.scenarios.empty());
}

// ============================================================================
// Time-Stepped Stream
// ============================================================================

TEST_F(DeliveryTest, TimeSteppedFrameCount) {
    auto stream = service.stream("gps-constellation", 3600.0, 60.0);
    int frames = 0;
    double lastOffset = -1.0;
    while (auto frame = stream.next()) {
        EXPECT_DOUBLE_EQ(frame->timeOffset, 60.0 * frames);
        EXPECT_EQ(frame->samples.size(), 24);
        lastOffset = frame->timeOffset;
        ++frames;
    }
    EXPECT_EQ(frames, 60);
    EXPECT_DOUBLE_EQ(lastOffset, 3540.0);
    EXPECT_TRUE(stream.done());
}

TEST_F(DeliveryTest, TimeSteppedPartialStep) {
    auto stream = service.stream("gps-constellation", 90.0, 60.0);
    auto first = stream.next();
    auto second = stream.next();
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(first->timestamp, now);
    EXPECT_EQ(second->timestamp, now + 60s);
    EXPECT_FALSE(stream.next().has_value());
}

TEST_F(DeliveryTest, TimeSteppedNonPositiveStep) {
    auto stream = service.stream("gps-constellation", 3600.0, 0.0);
    EXPECT_TRUE(stream.done());
    EXPECT_FALSE(stream.next().has_value());
}

TEST_F(DeliveryTest, TimeSteppedUnknownScenario) {
    auto stream = service.stream("nonexistent", 120.0, 60.0);
    auto frame = stream.next();
    ASSERT_TRUE(frame.has_value());
    EXPECT_TRUE(frame->samples.empty());
}

// ============================================================================
// Live Stream
// ============================================================================

TEST_F(DeliveryTest, LiveFollowsClock) {
    auto live = service.live("gps-constellation");
    EXPECT_EQ(live.next().timestamp, now);
    now += 5s;
    auto frame = live.next();
    EXPECT_EQ(frame.timestamp, now);
    EXPECT_EQ(frame.samples.size(), 24);
    EXPECT_FALSE(live.isPaused());
}

TEST_F(DeliveryTest, LiveJump) {
    auto live = service.live("gps-constellation");
    live.applyControl(ControlMessage{.timeOffset = 100.0});
    auto frame = live.next();
    EXPECT_EQ(frame.timestamp, now + 100s);
    EXPECT_DOUBLE_EQ(frame.timeOffset, 100.0);
    EXPECT_DOUBLE_EQ(live.getOffset(), 100.0);
}

TEST_F(DeliveryTest, LivePauseAndResume) {
    auto live = service.live("gps-constellation");
    time_point start = now;
    live.jumpTo(100.0);

    live.applyControl(ControlMessage{.command = "pause"});
    EXPECT_TRUE(live.isPaused());
    now += 10s;
    EXPECT_EQ(live.next().timestamp, start + 100s);

    live.applyControl(ControlMessage{.command = "resume"});
    EXPECT_FALSE(live.isPaused());
    now += 5s;
    // Resumes from the paused instant
    EXPECT_EQ(live.next().timestamp, start + 105s);
}

TEST_F(DeliveryTest, LiveJumpWhilePaused) {
    auto live = service.live("gps-constellation");
    live.pause();
    live.jumpTo(300.0);
    EXPECT_TRUE(live.isPaused());
    now += 20s;
    EXPECT_EQ(live.next().timestamp, now - 20s + 300s);
}

TEST_F(DeliveryTest, LiveJumpAndCommandTogether) {
    auto live = service.live("gps-constellation");
    live.applyControl(ControlMessage{.timeOffset = 60.0, .command = "pause"});
    EXPECT_TRUE(live.isPaused());
    now += 30s;
    EXPECT_EQ(live.next().timestamp, now - 30s + 60s);
}

TEST_F(DeliveryTest, LiveIgnoresUnknownCommand) {
    auto live = service.live("gps-constellation");
    live.applyControl(ControlMessage{.command = "rewind"});
    EXPECT_FALSE(live.isPaused());
    EXPECT_DOUBLE_EQ(live.getOffset(), 0.0);
    EXPECT_EQ(live.next().timestamp, now);
}

TEST_F(DeliveryTest, RepeatedPauseKeepsFirstInstant) {
    auto live = service.live("gps-constellation");
    live.pause();
    now += 10s;
    live.pause();
    EXPECT_EQ(live.next().timestamp, now - 10s);
}

}
}

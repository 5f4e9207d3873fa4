/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __ORBITCAST_DELIVERY_HPP
#define __ORBITCAST_DELIVERY_HPP

#include <orbitcast/cache.hpp>
#include <orbitcast/catalog.hpp>
#include <orbitcast/config.hpp>
#include <orbitcast/propagator.hpp>
#include <orbitcast/scenario.hpp>

#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace orbitcast {

/**
 * Converts a signed offset in seconds to a clock duration.
 */
std::chrono::system_clock::duration toDuration(double seconds);

/**
 * Propagates every satellite in [first, last) to t, dropping failures.
 */
std::vector<PositionSample> propagateAll(const Propagator &propagator,
                                         SatelliteSet::const_iterator first,
                                         SatelliteSet::const_iterator last,
                                         time_point t);

struct ChunkInfo {
    int chunkIndex;
    int chunkSize;
    int totalChunks;
    int totalSatellites;
};

/**
 * Positions of a scenario's satellites at one instant.
 */
struct PositionBatch {
    std::string scenarioID;
    time_point timestamp;
    double timeOffset = 0.0;
    std::vector<PositionSample> samples;

    double computationTimeMs = 0.0;
    std::string propagator;
    std::string dataSource;
    std::optional<ChunkInfo> chunk;
};

struct SatelliteSummary {
    std::string id;
    std::string name;
    OrbitRegime regime;
};

struct SatelliteListing {
    std::string scenarioID;
    std::vector<SatelliteSummary> satellites;
    double fetchTimeMs = 0.0;
    std::string dataSource;
};

// ============================================================================
// Compare
// ============================================================================

enum class CompareMetric {
    COUNT,
    ALTITUDE,
    VELOCITY,
    COVERAGE
};

/**
 * Parses a metric name. Unknown names fall back to COUNT.
 */
CompareMetric parseMetric(const std::string &metric);
std::string toString(CompareMetric metric);

struct CountSummary {
    int satelliteCount;
    std::string name;
};

struct RangeSummary {
    double min;
    double max;
    double mean;
    std::string unit;
};

struct CoverageSummary {
    double latitudeCoverage;    ///< Degrees between the southernmost and northernmost sample
    int satelliteCount;         ///< Samples the coverage was computed from
};

using ScenarioSummary = std::variant<CountSummary, RangeSummary, CoverageSummary>;

struct Comparison {
    CompareMetric metric;
    double timeOffset = 0.0;
    std::vector<std::pair<std::string, ScenarioSummary>> scenarios;
    double computationTimeMs = 0.0;
};

// ============================================================================
// Streams
// ============================================================================

/**
 * All surviving positions at one instant of a stream.
 */
struct Frame {
    time_point timestamp;
    double timeOffset = 0.0;
    std::vector<PositionSample> samples;
};

/**
 * Finite sequence of frames at t = 0, step, 2 step, ... while t < duration.
 *
 * The sequence can only be walked once. The propagator must outlive the stream.
 */
class TimeSteppedStream {
public:
    TimeSteppedStream(SharedSatelliteSet satellites, const Propagator &propagator,
                      time_point start, double durationSeconds, double stepSeconds);

    /**
     * Next frame, or nothing once the duration is reached.
     */
    std::optional<Frame> next();

    bool done() const;

private:
    SharedSatelliteSet satellites;
    const Propagator &propagator;
    time_point start;
    double duration;
    double step;
    long frame = 0;
};

/**
 * Commands a client can send to a live stream.
 */
struct ControlMessage {
    std::optional<double> timeOffset;
    std::optional<std::string> command;
};

/**
 * Unbounded sequence of frames at the current time plus a held offset.
 *
 * While paused, every frame repeats the instant at which the stream was
 * paused. Resuming continues from that instant.
 */
class LiveStream {
public:
    LiveStream(SharedSatelliteSet satellites, const Propagator &propagator, Clock clock = systemClock());

    Frame next();

    void jumpTo(double offsetSeconds);
    void pause();
    void resume();

    /**
     * Applies a time offset and/or a "pause" / "resume" command.
     * Unknown commands are logged and ignored.
     */
    void applyControl(const ControlMessage &message);

    bool isPaused() const;
    double getOffset() const;

private:
    time_point instant() const;

    SharedSatelliteSet satellites;
    const Propagator &propagator;
    Clock clock;
    double offset = 0.0;
    std::optional<time_point> frozenAt;
};

// ============================================================================
// Position Service
// ============================================================================

/**
 * Operations exposed to clients.
 */
class PositionService {
public:
    PositionService(Catalog &catalog, const Config &config, Clock clock = systemClock());
    ~PositionService() = default;

    std::vector<Scenario> listScenarios() const;

    /**
     * Scenario definition. Downloaded scenarios are materialized first so
     * the count is current.
     */
    std::optional<Scenario> getScenario(const std::string &scenarioID);

    SatelliteListing satellites(const std::string &scenarioID);

    /**
     * Positions of every satellite at now + offset.
     * @param limit Keep only the first limit satellites, a non-positive limit keeps all
     */
    PositionBatch positions(const std::string &scenarioID, double offsetSeconds,
                            std::optional<int> limit = std::nullopt);

    /**
     * Positions of the satellites in [chunkIndex * chunkSize, + chunkSize).
     * A non-positive chunk size returns every satellite. An out of range
     * chunk index returns no samples.
     */
    PositionBatch positions(const std::string &scenarioID, double offsetSeconds,
                            int chunkSize, int chunkIndex,
                            std::optional<int> limit = std::nullopt);

    /**
     * Compares scenarios by a metric.
     * @param scenarioIDs Comma separated scenario ids, unknown ids are skipped
     */
    Comparison compare(const std::string &scenarioIDs, const std::string &metric, double offsetSeconds = 0.0);

    TimeSteppedStream stream(const std::string &scenarioID, double durationSeconds, double stepSeconds);
    LiveStream live(const std::string &scenarioID);

    const Propagator& getPropagator() const;

private:
    PositionBatch buildBatch(const std::string &scenarioID, double offsetSeconds,
                             std::optional<int> limit, std::optional<std::pair<int, int>> chunk);
    std::optional<ScenarioSummary> summarize(const std::string &scenarioID, CompareMetric metric, time_point t);

    Catalog &catalog;
    const Config &config;
    Clock clock;
    CompositePropagator propagator;
};

}

#endif

/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <orbitcast/delivery.hpp>

#include <algorithm>
#include <chrono>
#include <cmath>

#include <spdlog/spdlog.h>

using spdlog::debug;
using spdlog::warn;

namespace orbitcast {

namespace {

// Elapsed milliseconds since a steady clock start time
double elapsedMs(std::chrono::steady_clock::time_point start) {
    using namespace std::chrono;
    return duration_cast<duration<double, std::milli>>(steady_clock::now() - start).count();
}

std::string trim(const std::string &str) {
    auto start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    auto end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

std::vector<std::string> splitIDs(const std::string &ids) {
    std::vector<std::string> result;
    std::size_t start = 0;
    while (start <= ids.size()) {
        auto end = ids.find(',', start);
        if (end == std::string::npos) end = ids.size();
        auto id = trim(ids.substr(start, end - start));
        if (!id.empty()) {
            result.push_back(id);
        }
        start = end + 1;
    }
    return result;
}

RangeSummary summarizeRange(const std::vector<double> &values, const std::string &unit) {
    auto [minIt, maxIt] = std::minmax_element(values.begin(), values.end());
    double sum = 0.0;
    for (double v : values) {
        sum += v;
    }
    return RangeSummary{
        .min = *minIt,
        .max = *maxIt,
        .mean = sum / static_cast<double>(values.size()),
        .unit = unit
    };
}

}

std::chrono::system_clock::duration toDuration(double seconds) {
    using namespace std::chrono;
    return duration_cast<system_clock::duration>(duration<double>(seconds));
}

std::vector<PositionSample> propagateAll(const Propagator &propagator,
                                         SatelliteSet::const_iterator first,
                                         SatelliteSet::const_iterator last,
                                         time_point t) {
    std::vector<PositionSample> samples;
    samples.reserve(static_cast<std::size_t>(std::distance(first, last)));
    for (auto it = first; it != last; ++it) {
        if (auto sample = propagator.propagate(*it, t)) {
            samples.push_back(std::move(*sample));
        }
    }
    return samples;
}

// ============================================================================
// Compare Metrics
// ============================================================================

CompareMetric parseMetric(const std::string &metric) {
    if (metric == "altitude") return CompareMetric::ALTITUDE;
    if (metric == "velocity") return CompareMetric::VELOCITY;
    if (metric == "coverage") return CompareMetric::COVERAGE;
    if (metric != "count") {
        debug("Unknown metric '{}', comparing by count", metric);
    }
    return CompareMetric::COUNT;
}

std::string toString(CompareMetric metric) {
    switch (metric) {
        case CompareMetric::COUNT: return "count";
        case CompareMetric::ALTITUDE: return "altitude";
        case CompareMetric::VELOCITY: return "velocity";
        case CompareMetric::COVERAGE: return "coverage";
    }
    return "count";
}

// ============================================================================
// Time-Stepped Stream
// ============================================================================

TimeSteppedStream::TimeSteppedStream(SharedSatelliteSet satellites, const Propagator &propagator,
                                     time_point start, double durationSeconds, double stepSeconds)
    : satellites(std::move(satellites)), propagator(propagator), start(start),
      duration(durationSeconds), step(stepSeconds) {}

bool TimeSteppedStream::done() const {
    if (!(step > 0.0)) {
        return true;
    }
    return static_cast<double>(frame) * step >= duration;
}

std::optional<Frame> TimeSteppedStream::next() {
    if (done()) {
        return std::nullopt;
    }

    double t = static_cast<double>(frame) * step;
    ++frame;

    time_point instant = start + toDuration(t);
    return Frame{
        .timestamp = instant,
        .timeOffset = t,
        .samples = propagateAll(propagator, satellites->begin(), satellites->end(), instant)
    };
}

// ============================================================================
// Live Stream
// ============================================================================

LiveStream::LiveStream(SharedSatelliteSet satellites, const Propagator &propagator, Clock clock)
    : satellites(std::move(satellites)), propagator(propagator), clock(std::move(clock)) {}

time_point LiveStream::instant() const {
    if (frozenAt) {
        return *frozenAt;
    }
    return clock() + toDuration(offset);
}

Frame LiveStream::next() {
    time_point t = instant();
    return Frame{
        .timestamp = t,
        .timeOffset = offset,
        .samples = propagateAll(propagator, satellites->begin(), satellites->end(), t)
    };
}

void LiveStream::jumpTo(double offsetSeconds) {
    offset = offsetSeconds;
    if (frozenAt) {
        frozenAt = clock() + toDuration(offset);
    }
    debug("Live stream offset set to {} seconds", offset);
}

void LiveStream::pause() {
    if (!frozenAt) {
        frozenAt = instant();
        debug("Live stream paused");
    }
}

void LiveStream::resume() {
    if (frozenAt) {
        using namespace std::chrono;
        offset = duration_cast<duration<double>>(*frozenAt - clock()).count();
        frozenAt.reset();
        debug("Live stream resumed with offset {} seconds", offset);
    }
}

void LiveStream::applyControl(const ControlMessage &message) {
    if (message.timeOffset) {
        jumpTo(*message.timeOffset);
    }
    if (message.command) {
        if (*message.command == "pause") {
            pause();
        } else if (*message.command == "resume") {
            resume();
        } else {
            warn("Ignoring unknown live stream command '{}'", *message.command);
        }
    }
}

bool LiveStream::isPaused() const {
    return frozenAt.has_value();
}

double LiveStream::getOffset() const {
    return offset;
}

// ============================================================================
// Position Service
// ============================================================================

PositionService::PositionService(Catalog &catalog, const Config &config, Clock clock)
    : catalog(catalog), config(config), clock(std::move(clock)),
      propagator(KeplerSolverOptions{
          .iterations = config.getKeplerIterations(),
          .tolerance = config.getKeplerTolerance()
      }) {}

const Propagator& PositionService::getPropagator() const {
    return propagator;
}

std::vector<Scenario> PositionService::listScenarios() const {
    return catalog.getRegistry().list();
}

std::optional<Scenario> PositionService::getScenario(const std::string &scenarioID) {
    auto scenario = catalog.getRegistry().find(scenarioID);
    if (!scenario) {
        return std::nullopt;
    }
    if (!scenario->isGenerated()) {
        catalog.materialize(scenarioID);
        scenario = catalog.getRegistry().find(scenarioID);
    }
    return scenario;
}

SatelliteListing PositionService::satellites(const std::string &scenarioID) {
    auto start = std::chrono::steady_clock::now();

    auto satellites = catalog.materialize(scenarioID);

    SatelliteListing listing;
    listing.scenarioID = scenarioID;
    listing.satellites.reserve(satellites->size());
    for (const auto &satellite : *satellites) {
        listing.satellites.push_back(SatelliteSummary{
            .id = satellite.getID(),
            .name = satellite.getName(),
            .regime = satellite.getRegime()
        });
    }
    listing.dataSource = catalog.dataSource(scenarioID);
    listing.fetchTimeMs = elapsedMs(start);
    return listing;
}

PositionBatch PositionService::positions(const std::string &scenarioID, double offsetSeconds,
                                         std::optional<int> limit) {
    return buildBatch(scenarioID, offsetSeconds, limit, std::nullopt);
}

PositionBatch PositionService::positions(const std::string &scenarioID, double offsetSeconds,
                                         int chunkSize, int chunkIndex,
                                         std::optional<int> limit) {
    if (chunkSize <= 0) {
        return buildBatch(scenarioID, offsetSeconds, limit, std::nullopt);
    }
    return buildBatch(scenarioID, offsetSeconds, limit, std::make_pair(chunkSize, chunkIndex));
}

PositionBatch PositionService::buildBatch(const std::string &scenarioID, double offsetSeconds,
                                          std::optional<int> limit, std::optional<std::pair<int, int>> chunk) {
    auto start = std::chrono::steady_clock::now();

    auto satellites = catalog.materialize(scenarioID);

    auto first = satellites->begin();
    auto last = satellites->end();

    // The limit applies before chunking, a non-positive limit means no limit
    if (limit && *limit > 0 && static_cast<std::size_t>(*limit) < satellites->size()) {
        last = first + *limit;
    }
    int total = static_cast<int>(std::distance(first, last));

    PositionBatch batch;
    batch.scenarioID = scenarioID;
    batch.timeOffset = offsetSeconds;
    batch.timestamp = clock() + toDuration(offsetSeconds);

    if (chunk) {
        auto [chunkSize, chunkIndex] = *chunk;
        int totalChunks = total / chunkSize + (total % chunkSize != 0 ? 1 : 0);
        batch.chunk = ChunkInfo{
            .chunkIndex = chunkIndex,
            .chunkSize = chunkSize,
            .totalChunks = totalChunks,
            .totalSatellites = total
        };

        if (chunkIndex < 0 || chunkIndex >= totalChunks) {
            first = last;
        } else {
            auto offset = static_cast<std::ptrdiff_t>(chunkIndex) * chunkSize;
            first = first + offset;
            last = first + std::min<std::ptrdiff_t>(chunkSize, total - offset);
        }
    }

    batch.samples = propagateAll(propagator, first, last, batch.timestamp);
    batch.propagator = propagator.nameFor(*satellites);
    batch.dataSource = catalog.dataSource(scenarioID);
    batch.computationTimeMs = elapsedMs(start);

    debug("Propagated {} of {} satellites for {} in {:.2f} ms",
          batch.samples.size(), std::distance(first, last), scenarioID, batch.computationTimeMs);
    return batch;
}

std::optional<ScenarioSummary> PositionService::summarize(const std::string &scenarioID, CompareMetric metric, time_point t) {
    auto scenario = catalog.getRegistry().find(scenarioID);
    auto satellites = catalog.materialize(scenarioID);

    if (metric == CompareMetric::COUNT) {
        // Materialization refreshes the registry count
        return CountSummary{
            .satelliteCount = static_cast<int>(satellites->size()),
            .name = scenario->name
        };
    }

    auto sampled = std::min<std::size_t>(satellites->size(), static_cast<std::size_t>(config.getCompareSampleLimit()));
    auto samples = propagateAll(propagator, satellites->begin(), satellites->begin() + sampled, t);
    if (samples.empty()) {
        return std::nullopt;
    }

    std::vector<double> values;
    values.reserve(samples.size());

    switch (metric) {
        case CompareMetric::ALTITUDE:
            for (const auto &s : samples) values.push_back(s.altitude / 1000.0);
            return summarizeRange(values, "km");
        case CompareMetric::VELOCITY:
            for (const auto &s : samples) values.push_back(s.speed);
            return summarizeRange(values, "km/s");
        case CompareMetric::COVERAGE: {
            auto [south, north] = std::minmax_element(samples.begin(), samples.end(),
                [](const PositionSample &a, const PositionSample &b) { return a.latitude < b.latitude; });
            return CoverageSummary{
                .latitudeCoverage = north->latitude - south->latitude,
                .satelliteCount = static_cast<int>(samples.size())
            };
        }
        case CompareMetric::COUNT:
            break;
    }
    return std::nullopt;
}

Comparison PositionService::compare(const std::string &scenarioIDs, const std::string &metric, double offsetSeconds) {
    auto start = std::chrono::steady_clock::now();

    Comparison comparison{
        .metric = parseMetric(metric),
        .timeOffset = offsetSeconds
    };
    time_point t = clock() + toDuration(offsetSeconds);

    for (const auto &id : splitIDs(scenarioIDs)) {
        if (!catalog.getRegistry().contains(id)) {
            debug("Skipping unknown scenario {}", id);
            continue;
        }
        if (auto summary = summarize(id, comparison.metric, t)) {
            comparison.scenarios.emplace_back(id, std::move(*summary));
        }
    }

    comparison.computationTimeMs = elapsedMs(start);
    return comparison;
}

TimeSteppedStream PositionService::stream(const std::string &scenarioID, double durationSeconds, double stepSeconds) {
    return TimeSteppedStream(catalog.materialize(scenarioID), propagator, clock(), durationSeconds, stepSeconds);
}

LiveStream PositionService::live(const std::string &scenarioID) {
    return LiveStream(catalog.materialize(scenarioID), propagator, clock);
}

}

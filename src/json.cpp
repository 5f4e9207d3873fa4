/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <orbitcast/json.hpp>

#include <chrono>
#include <cmath>

#include <date/date.h>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <spdlog/spdlog.h>

using spdlog::warn;

namespace orbitcast::json {

namespace {

using JSONWriter = rapidjson::Writer<rapidjson::StringBuffer>;

constexpr const char *SERVICE_NAME = "Satellite Constellation Simulator";
constexpr const char *SERVICE_VERSION = "1.0.0";

// Latency values are reported with two decimals
double roundMs(double ms) {
    return std::round(ms * 100.0) / 100.0;
}

void writeString(JSONWriter &writer, const char *key, const std::string &value) {
    writer.Key(key);
    writer.String(value.c_str(), static_cast<rapidjson::SizeType>(value.size()));
}

void writeDouble(JSONWriter &writer, const char *key, double value) {
    writer.Key(key);
    if (std::isfinite(value)) {
        writer.Double(value);
    } else {
        writer.Null();
    }
}

void writeInt(JSONWriter &writer, const char *key, int value) {
    writer.Key(key);
    writer.Int(value);
}

void writeScenario(JSONWriter &writer, const Scenario &scenario) {
    writer.StartObject();
    writeString(writer, "id", scenario.id);
    writeString(writer, "name", scenario.name);
    writeString(writer, "description", scenario.description);
    writeInt(writer, "satellite_count", scenario.satelliteCount);
    writeString(writer, "created_at", formatTimestamp(scenario.createdAt));
    writeDouble(writer, "duration_hours", scenario.durationHours);

    if (const auto *source = std::get_if<ExternalSource>(&scenario.source)) {
        writeString(writer, "tle_url", source->url);
    } else {
        const auto &parameters = std::get<WalkerParameters>(scenario.source);
        writer.Key("generation");
        writer.StartObject();
        writeInt(writer, "planes", parameters.planes);
        writeInt(writer, "satellites_per_plane", parameters.satellitesPerPlane);
        writeDouble(writer, "altitude_km", parameters.altitude);
        writeDouble(writer, "inclination_deg", parameters.inclination);
        writeString(writer, "orbit_type", toString(parameters.regime));
        writer.EndObject();
    }
    writer.EndObject();
}

void writeSample(JSONWriter &writer, const PositionSample &sample) {
    writer.StartObject();
    writeString(writer, "id", sample.id);
    writeString(writer, "name", sample.name);
    writeString(writer, "orbit_type", toString(sample.regime));
    writeDouble(writer, "longitude", sample.longitude);
    writeDouble(writer, "latitude", sample.latitude);
    writeDouble(writer, "altitude", sample.altitude);
    writeDouble(writer, "velocity", sample.speed);
    writer.EndObject();
}

void writeSamples(JSONWriter &writer, const std::vector<PositionSample> &samples) {
    writeInt(writer, "count", static_cast<int>(samples.size()));
    writer.Key("positions");
    writer.StartArray();
    for (const auto &sample : samples) {
        writeSample(writer, sample);
    }
    writer.EndArray();
}

void writeSummary(JSONWriter &writer, const ScenarioSummary &summary) {
    writer.StartObject();
    if (const auto *count = std::get_if<CountSummary>(&summary)) {
        writeInt(writer, "satellite_count", count->satelliteCount);
        writeString(writer, "name", count->name);
    } else if (const auto *range = std::get_if<RangeSummary>(&summary)) {
        writeDouble(writer, "min", range->min);
        writeDouble(writer, "max", range->max);
        writeDouble(writer, "mean", range->mean);
        writeString(writer, "unit", range->unit);
    } else if (const auto *coverage = std::get_if<CoverageSummary>(&summary)) {
        writeDouble(writer, "lat_coverage", coverage->latitudeCoverage);
        writeInt(writer, "satellite_count", coverage->satelliteCount);
    }
    writer.EndObject();
}

}

std::string formatTimestamp(time_point tp) {
    auto truncated = std::chrono::floor<std::chrono::milliseconds>(tp);
    return date::format("%FT%TZ", truncated);
}

std::string toJSON(const Scenario &scenario) {
    rapidjson::StringBuffer buffer;
    JSONWriter writer(buffer);
    writeScenario(writer, scenario);
    return buffer.GetString();
}

std::string toJSON(const std::vector<Scenario> &scenarios) {
    rapidjson::StringBuffer buffer;
    JSONWriter writer(buffer);
    writer.StartObject();
    writer.Key("scenarios");
    writer.StartArray();
    for (const auto &scenario : scenarios) {
        writeScenario(writer, scenario);
    }
    writer.EndArray();
    writer.EndObject();
    return buffer.GetString();
}

std::string toJSON(const SatelliteListing &listing) {
    rapidjson::StringBuffer buffer;
    JSONWriter writer(buffer);
    writer.StartObject();
    writeString(writer, "scenario_id", listing.scenarioID);
    writeInt(writer, "count", static_cast<int>(listing.satellites.size()));
    writer.Key("satellites");
    writer.StartArray();
    for (const auto &satellite : listing.satellites) {
        writer.StartObject();
        writeString(writer, "id", satellite.id);
        writeString(writer, "name", satellite.name);
        writeString(writer, "orbit_type", toString(satellite.regime));
        writer.EndObject();
    }
    writer.EndArray();
    writer.Key("_meta");
    writer.StartObject();
    writeDouble(writer, "fetch_time_ms", roundMs(listing.fetchTimeMs));
    writeString(writer, "data_source", listing.dataSource);
    writer.EndObject();
    writer.EndObject();
    return buffer.GetString();
}

std::string toJSON(const PositionBatch &batch) {
    rapidjson::StringBuffer buffer;
    JSONWriter writer(buffer);
    writer.StartObject();
    writeString(writer, "scenario_id", batch.scenarioID);
    writeString(writer, "timestamp", formatTimestamp(batch.timestamp));
    writeDouble(writer, "time_offset_seconds", batch.timeOffset);
    writeSamples(writer, batch.samples);
    writer.Key("_meta");
    writer.StartObject();
    writeDouble(writer, "computation_time_ms", roundMs(batch.computationTimeMs));
    writeString(writer, "data_source", batch.dataSource);
    writeString(writer, "propagator", batch.propagator);
    if (batch.chunk) {
        writeInt(writer, "chunk_index", batch.chunk->chunkIndex);
        writeInt(writer, "chunk_size", batch.chunk->chunkSize);
        writeInt(writer, "total_chunks", batch.chunk->totalChunks);
        writeInt(writer, "total_satellites", batch.chunk->totalSatellites);
    }
    writer.EndObject();
    writer.EndObject();
    return buffer.GetString();
}

std::string toJSON(const Comparison &comparison) {
    rapidjson::StringBuffer buffer;
    JSONWriter writer(buffer);
    writer.StartObject();
    writeString(writer, "metric", toString(comparison.metric));
    writeDouble(writer, "time_offset_seconds", comparison.timeOffset);
    writer.Key("comparison");
    writer.StartObject();
    for (const auto &[id, summary] : comparison.scenarios) {
        writer.Key(id.c_str(), static_cast<rapidjson::SizeType>(id.size()));
        writeSummary(writer, summary);
    }
    writer.EndObject();
    writer.Key("_meta");
    writer.StartObject();
    writeDouble(writer, "computation_time_ms", roundMs(comparison.computationTimeMs));
    writer.EndObject();
    writer.EndObject();
    return buffer.GetString();
}

std::string toJSON(const Frame &frame) {
    rapidjson::StringBuffer buffer;
    JSONWriter writer(buffer);
    writer.StartObject();
    writeString(writer, "timestamp", formatTimestamp(frame.timestamp));
    writeDouble(writer, "time_offset_seconds", frame.timeOffset);
    writeSamples(writer, frame.samples);
    writer.EndObject();
    return buffer.GetString();
}

std::string errorJSON(const std::string &message) {
    rapidjson::StringBuffer buffer;
    JSONWriter writer(buffer);
    writer.StartObject();
    writeString(writer, "error", message);
    writer.EndObject();
    return buffer.GetString();
}

std::string healthJSON(time_point now) {
    rapidjson::StringBuffer buffer;
    JSONWriter writer(buffer);
    writer.StartObject();
    writeString(writer, "status", "healthy");
    writeString(writer, "timestamp", formatTimestamp(now));
    writer.EndObject();
    return buffer.GetString();
}

std::string serviceInfoJSON() {
    rapidjson::StringBuffer buffer;
    JSONWriter writer(buffer);
    writer.StartObject();
    writeString(writer, "service", SERVICE_NAME);
    writeString(writer, "version", SERVICE_VERSION);
    writeString(writer, "data_source", "CelesTrak");
    writer.Key("commands");
    writer.StartObject();
    writeString(writer, "scenarios", "orbitcast scenarios [id]");
    writeString(writer, "satellites", "orbitcast satellites <id>");
    writeString(writer, "positions", "orbitcast positions <id>");
    writeString(writer, "compare", "orbitcast compare <id,id,...>");
    writeString(writer, "stream", "orbitcast stream <id>");
    writeString(writer, "live", "orbitcast live <id>");
    writer.EndObject();
    writer.EndObject();
    return buffer.GetString();
}

std::optional<ControlMessage> parseControlMessage(std::string_view text) {
    rapidjson::Document doc;
    doc.Parse(text.data(), text.size());

    if (doc.HasParseError()) {
        warn("Ignoring malformed control message: {}", rapidjson::GetParseError_En(doc.GetParseError()));
        return std::nullopt;
    }
    if (!doc.IsObject()) {
        warn("Ignoring control message that isn't an object");
        return std::nullopt;
    }

    ControlMessage message;
    if (doc.HasMember("time_offset")) {
        if (!doc["time_offset"].IsNumber()) {
            warn("Ignoring control message with a non-numeric time_offset");
            return std::nullopt;
        }
        message.timeOffset = doc["time_offset"].GetDouble();
    }
    if (doc.HasMember("command")) {
        if (!doc["command"].IsString()) {
            warn("Ignoring control message with a non-string command");
            return std::nullopt;
        }
        message.command = std::string(doc["command"].GetString(), doc["command"].GetStringLength());
    }
    return message;
}

} // namespace orbitcast::json

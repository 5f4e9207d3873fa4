/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __ORBITCAST_JSON_HPP
#define __ORBITCAST_JSON_HPP

#include <orbitcast/delivery.hpp>
#include <orbitcast/scenario.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace orbitcast::json {

/**
 * ISO-8601 UTC timestamp with millisecond precision (e.g. 2025-01-01T00:00:00.000Z).
 */
std::string formatTimestamp(time_point tp);

std::string toJSON(const Scenario &scenario);
std::string toJSON(const std::vector<Scenario> &scenarios);
std::string toJSON(const SatelliteListing &listing);
std::string toJSON(const PositionBatch &batch);
std::string toJSON(const Comparison &comparison);
std::string toJSON(const Frame &frame);

/**
 * {"error": message}
 */
std::string errorJSON(const std::string &message);

/**
 * {"status": "healthy", "timestamp": ...}
 */
std::string healthJSON(time_point now);

/**
 * Name, version and commands of the service.
 */
std::string serviceInfoJSON();

/**
 * Parses a live stream control message such as {"time_offset": 3600},
 * {"command": "pause"} or {"command": "resume"}.
 *
 * Returns nothing, after logging a warning, if the text isn't a JSON object
 * or a field has the wrong type.
 */
std::optional<ControlMessage> parseControlMessage(std::string_view text);

} // namespace orbitcast::json

#endif

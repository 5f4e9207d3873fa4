/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __ORBITCAST_CELESTRAK_HPP
#define __ORBITCAST_CELESTRAK_HPP

#include <chrono>
#include <string>

namespace orbitcast::celestrak {

// Celestrak GP data URL
// Documentation: https://celestrak.org/NORAD/documentation/gp-data-formats.php
constexpr const char *BASE_URI = "https://celestrak.org/NORAD/elements/gp.php";

constexpr std::chrono::seconds DEFAULT_TIMEOUT{30};

/**
 * URL of the TLE listing for a satellite group.
 * @param group The group name (e.g., "active", "stations", "gps-ops", etc.)
 *              Defaults to "active" if empty
 */
std::string groupURL(const std::string &baseURI, const std::string &group);

/**
 * Checks a response body for Celestrak's error text.
 * @throws std::runtime_error if the body reports that no data was found
 */
void checkResponse(const std::string &url, const std::string &body);

/**
 * Download TLE text from a Celestrak URL, following redirects.
 * @return The response body
 * @throws std::runtime_error if the download fails, the server returns an
 *         error status, or the body reports that no data was found
 */
std::string fetchTLE(const std::string &url, std::chrono::seconds timeout = DEFAULT_TIMEOUT);

} // namespace orbitcast::celestrak

#endif

/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __ORBITCAST_TLE_HPP
#define __ORBITCAST_TLE_HPP

#include <orbitcast/elements.hpp>

#include <stdexcept>
#include <string>
#include <string_view>

namespace orbitcast {

/**
 * Thrown when a two-line element record can't be decoded.
 */
class MalformedElementRecord : public std::invalid_argument {
public:
    explicit MalformedElementRecord(const std::string &msg) : std::invalid_argument(msg) {}
};

/**
 * Decodes a single two-line element record.
 *
 * @param name Display name of the satellite (the name line)
 * @param line1 First data line, must start with "1 "
 * @param line2 Second data line, must start with "2 "
 * @throws MalformedElementRecord if a line is short or a field isn't numeric
 */
Satellite parseTwoLineElements(std::string_view name, std::string_view line1, std::string_view line2);

/**
 * Parses a block of three-line records (name, line 1, line 2).
 *
 * Lines that don't form a record are skipped one at a time until the
 * next record lines up. Records that fail to decode are logged and dropped.
 * The result keeps the input order.
 */
SatelliteSet parseTLE(std::string_view text);

/**
 * Parses a TLE epoch field (YYDDD.DDDDDDDD).
 */
time_point parseEpoch(std::string_view epoch);

}

#endif

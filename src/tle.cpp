/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <orbitcast/tle.hpp>

#include <charconv>
#include <chrono>
#include <cmath>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

using spdlog::debug;
using spdlog::warn;

namespace orbitcast {

namespace {

constexpr std::string_view WHITESPACE = " \t\r";

// Helper function to trim leading whitespace from a string_view
std::string_view trimLeft(const std::string_view &str) {
    auto pos = str.find_first_not_of(WHITESPACE);
    return pos == std::string_view::npos ? "" : str.substr(pos);
}

// Helper function to trim trailing whitespace from a string_view
std::string_view trimRight(const std::string_view &str) {
    auto pos = str.find_last_not_of(WHITESPACE);
    return pos == std::string_view::npos ? "" : str.substr(0, pos + 1);
}

std::string_view trim(const std::string_view &str) {
    return trimLeft(trimRight(str));
}

// Helper function to convert substring to numeric type
template <typename T>
inline T toNumber(const std::string_view &str) {
    // from_chars doesn't accept a leading plus sign
    std::string_view digits = str.starts_with('+') ? str.substr(1) : str;
    T value;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec != std::errc() || ptr != digits.data() + digits.size() || digits.empty()) {
        throw MalformedElementRecord("Couldn't convert value: '" + std::string(str) + "'");
    }
    return value;
}

// Helper function to extract a fixed column field
std::string_view column(const std::string_view &line, std::size_t start, std::size_t length, const char *field) {
    if (line.size() < start + length) {
        throw MalformedElementRecord(std::string("Line too short for ") + field + ": '" + std::string(line) + "'");
    }
    return line.substr(start, length);
}

// Helper function to convert exponential substring to numeric type
// Example input: "11606-4" -> 0.00011606, "-11606-4" -> -0.00011606
double fromExponentialString(std::string_view str) {
    str = trim(str);

    bool negativeMantissa = false;
    if (str.starts_with('-') || str.starts_with('+')) {
        negativeMantissa = str.front() == '-';
        str.remove_prefix(1);
    }

    auto pos = str.find_last_of("-+");
    if (pos == std::string_view::npos || pos == 0) {
        throw MalformedElementRecord("Invalid exponential format: '" + std::string(str) + "'");
    }

    std::string baseStr = "0." + std::string(trimRight(str.substr(0, pos)));
    int exponent = toNumber<int>(str.substr(pos + 1));
    if (str[pos] == '-') {
        exponent = -exponent;
    }

    double value = toNumber<double>(baseStr) * std::pow(10.0, exponent);
    return negativeMantissa ? -value : value;
}

// Eccentricity is stored with an implied leading decimal point
double fromImpliedDecimal(std::string_view str) {
    str = trim(str);
    if (str.empty()) {
        throw MalformedElementRecord("Missing eccentricity");
    }
    return toNumber<double>("0." + std::string(str));
}

std::vector<std::string_view> splitLines(std::string_view text) {
    std::vector<std::string_view> lines;
    while (true) {
        auto pos = text.find('\n');
        lines.push_back(trim(text.substr(0, pos)));
        if (pos == std::string_view::npos) break;
        text.remove_prefix(pos + 1);
    }
    return lines;
}

}

// Helper function to parse epoch from TLE format (YYDDD.DDDDDDDD)
time_point parseEpoch(std::string_view epochStr) {
    using namespace std::chrono;

    epochStr = trim(epochStr);
    if (epochStr.size() < 5) {
        throw MalformedElementRecord("Invalid epoch: '" + std::string(epochStr) + "'");
    }

    int y = toNumber<int>(trimLeft(epochStr.substr(0, 2)));
    double dayOfYear = toNumber<double>(trimLeft(epochStr.substr(2)));
    if (dayOfYear < 1.0 || dayOfYear >= 367.0) {
        throw MalformedElementRecord("Invalid epoch day: '" + std::string(epochStr) + "'");
    }

    // Convert two-digit year to four-digit year
    if (y < 57) {
        y += 2000;
    } else {
        y += 1900;
    }

    int wholeDays = static_cast<int>(dayOfYear);
    double fracDays = dayOfYear - wholeDays;

    auto date = sys_days{year{y}/January/1} + days{wholeDays - 1};
    auto time = duration_cast<microseconds>(duration<double, std::ratio<86400>>{fracDays});

    return date + time;
}

Satellite parseTwoLineElements(std::string_view name, std::string_view line1, std::string_view line2) {
    line1 = trim(line1);
    line2 = trim(line2);

    if (!line1.starts_with("1 ")) {
        throw MalformedElementRecord("Line 1 must start with '1 ': '" + std::string(line1) + "'");
    }
    if (!line2.starts_with("2 ")) {
        throw MalformedElementRecord("Line 2 must start with '2 ': '" + std::string(line2) + "'");
    }

    TwoLineElements tle;
    tle.line1 = std::string(line1);
    tle.line2 = std::string(line2);

    // Catalog number is columns 3-7
    tle.catalogID = std::string(trim(column(line1, 2, 5, "catalog number")));
    if (tle.catalogID.empty()) {
        throw MalformedElementRecord("Missing catalog number");
    }
    // Classification is column 8
    tle.classification = column(line1, 7, 1, "classification")[0];
    // Designator is columns 10-17
    tle.designator = std::string(trim(column(line1, 9, 8, "designator")));
    // Epoch is columns 19-32
    tle.epoch = parseEpoch(column(line1, 18, 14, "epoch"));
    // First Derivative of Mean Motion is columns 34-43
    tle.firstDerivativeMeanMotion = toNumber<double>(trim(column(line1, 33, 10, "first derivative")));
    // Second Derivative of Mean Motion is columns 45-52 (exponential format)
    tle.secondDerivativeMeanMotion = fromExponentialString(column(line1, 44, 8, "second derivative"));
    // Bstar Drag Term is columns 54-61 (exponential format)
    tle.bstarDragTerm = fromExponentialString(column(line1, 53, 8, "bstar"));
    // Element Set Number is columns 65-68
    tle.elementSetNumber = toNumber<int>(trim(column(line1, 64, 4, "element set number")));

    // Inclination is columns 9-16
    tle.inclination = toNumber<double>(trim(column(line2, 8, 8, "inclination")));
    // RAAN is columns 18-25
    tle.rightAscensionOfAscendingNode = toNumber<double>(trim(column(line2, 17, 8, "right ascension")));
    // Eccentricity is columns 27-33 (decimal implied)
    tle.eccentricity = fromImpliedDecimal(column(line2, 26, 7, "eccentricity"));
    // Argument of perigee is columns 35-42
    tle.argumentOfPerigee = toNumber<double>(trim(column(line2, 34, 8, "argument of perigee")));
    // Mean Anomaly is columns 44-51
    tle.meanAnomaly = toNumber<double>(trim(column(line2, 43, 8, "mean anomaly")));
    // Mean Motion is columns 53-63
    tle.meanMotion = toNumber<double>(trim(column(line2, 52, 11, "mean motion")));
    // Revolution number at epoch is columns 64-68, some sources truncate it
    auto revolutions = trim(line2.size() > 63 ? line2.substr(63, 5) : std::string_view{});
    tle.revolutionNumberAtEpoch = revolutions.empty() ? 0 : toNumber<int>(revolutions);

    if (!(tle.meanMotion > 0.0)) {
        throw MalformedElementRecord("Mean motion must be positive: " + std::to_string(tle.meanMotion));
    }
    if (tle.eccentricity < 0.0 || tle.eccentricity >= 1.0) {
        throw MalformedElementRecord("Eccentricity out of range: " + std::to_string(tle.eccentricity));
    }

    std::string id = tle.catalogID;
    return Satellite(std::move(id), std::string(trim(name)), std::move(tle));
}

SatelliteSet parseTLE(std::string_view text) {
    SatelliteSet satellites;

    auto lines = splitLines(trim(text));

    std::size_t i = 0;
    while (i + 2 < lines.size()) {
        auto name = lines[i];
        auto line1 = lines[i + 1];
        auto line2 = lines[i + 2];

        if (!line1.starts_with("1 ") || !line2.starts_with("2 ")) {
            i += 1;
            continue;
        }

        try {
            satellites.push_back(parseTwoLineElements(name, line1, line2));
        } catch (const MalformedElementRecord &e) {
            warn("Error parsing TLE for {}: {}", name, e.what());
        }

        i += 3;
    }

    debug("Parsed {} satellites from {} lines", satellites.size(), lines.size());
    return satellites;
}

}

/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <orbitcast/config.hpp>

namespace orbitcast {

std::chrono::seconds Config::getCacheTTL() const {
    return cacheTTL;
}

void Config::setCacheTTL(const std::chrono::seconds ttl) {
    using namespace std::chrono;
    if (ttl >= seconds(1) && ttl <= hours(24)) {
        cacheTTL = ttl;
    } else if (ttl > hours(24)) {
        cacheTTL = hours(24);
    } else {
        cacheTTL = seconds(1);
    }
}

std::chrono::milliseconds Config::getFrameDelay() const {
    return frameDelay;
}

void Config::setFrameDelay(const std::chrono::milliseconds delay) {
    using namespace std::chrono;
    if (delay >= milliseconds(0) && delay <= seconds(10)) {
        frameDelay = delay;
    } else if (delay > seconds(10)) {
        frameDelay = seconds(10);
    } else {
        frameDelay = milliseconds(0);
    }
}

int Config::getLiveFramesPerSecond() const {
    return liveFramesPerSecond;
}

void Config::setLiveFramesPerSecond(const int fps) {
    if (fps >= 1 && fps <= 30) {
        liveFramesPerSecond = fps;
    } else if (fps > 30) {
        liveFramesPerSecond = 30;
    } else {
        liveFramesPerSecond = 1;
    }
}

std::chrono::milliseconds Config::getLiveFrameInterval() const {
    return std::chrono::milliseconds(1000 / liveFramesPerSecond);
}

int Config::getCompareSampleLimit() const {
    return compareSampleLimit;
}

void Config::setCompareSampleLimit(const int limit) {
    compareSampleLimit = limit >= 1 ? limit : 1;
}

int Config::getKeplerIterations() const {
    return keplerIterations;
}

void Config::setKeplerIterations(const int iterations) {
    if (iterations >= 1 && iterations <= 1000) {
        keplerIterations = iterations;
    } else if (iterations > 1000) {
        keplerIterations = 1000;
    } else {
        keplerIterations = 1;
    }
}

double Config::getKeplerTolerance() const {
    return keplerTolerance;
}

void Config::setKeplerTolerance(const double tolerance) {
    keplerTolerance = tolerance > 0.0 ? tolerance : 0.0;
}

bool Config::getDeterministicGeneration() const {
    return deterministicGeneration;
}

void Config::setDeterministicGeneration(bool deterministic) {
    deterministicGeneration = deterministic;
}

std::string Config::getElementSourceURL() const {
    return elementSourceURL;
}

void Config::setElementSourceURL(const std::string &url) {
    elementSourceURL = url;
}

bool Config::getVerbose() const {
    return verbose;
}

void Config::setVerbose(bool v) {
    verbose = v;
}

}

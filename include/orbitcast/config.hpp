/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __ORBITCAST_CONFIG_HPP
#define __ORBITCAST_CONFIG_HPP

#include <chrono>
#include <string>

namespace orbitcast {

class Config {
public:
    Config() = default;
    ~Config() = default;

    // How long a materialized satellite set stays valid (1 second to 1 day)
    std::chrono::seconds getCacheTTL() const;
    void setCacheTTL(const std::chrono::seconds ttl);

    // Delay between frames of a time-stepped stream (0 to 10 seconds)
    std::chrono::milliseconds getFrameDelay() const;
    void setFrameDelay(const std::chrono::milliseconds delay);

    // Frame rate of a live stream (1 to 30 frames per second)
    int getLiveFramesPerSecond() const;
    void setLiveFramesPerSecond(const int fps);
    std::chrono::milliseconds getLiveFrameInterval() const;

    // Satellites sampled per scenario by compare (at least 1)
    int getCompareSampleLimit() const;
    void setCompareSampleLimit(const int limit);

    // Kepler solver iterations (1 to 1000)
    int getKeplerIterations() const;
    void setKeplerIterations(const int iterations);

    // Kepler solver early exit tolerance in radians (0 disables early exit)
    double getKeplerTolerance() const;
    void setKeplerTolerance(const double tolerance);

    bool getDeterministicGeneration() const;
    void setDeterministicGeneration(bool deterministic);

    std::string getElementSourceURL() const;
    void setElementSourceURL(const std::string &url);

    bool getVerbose() const;
    void setVerbose(bool);

private:
    std::chrono::seconds cacheTTL{3600};
    std::chrono::milliseconds frameDelay{100};
    int liveFramesPerSecond = 1;
    int compareSampleLimit = 100;
    int keplerIterations = 10;
    double keplerTolerance = 0.0;
    bool deterministicGeneration = false;
    std::string elementSourceURL = "https://celestrak.org/NORAD/elements/gp.php";
    bool verbose = false;
};

}

#endif

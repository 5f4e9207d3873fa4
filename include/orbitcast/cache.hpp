/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __ORBITCAST_CACHE_HPP
#define __ORBITCAST_CACHE_HPP

#include <orbitcast/elements.hpp>

#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <string>

namespace orbitcast {

using Clock = std::function<time_point()>;

/**
 * Returns std::chrono::system_clock::now().
 */
Clock systemClock();

/**
 * Satellite sets per scenario, each valid for a fixed time-to-live.
 *
 * Entries are replaced whole and never updated in place. Expiry is checked
 * on read; expired entries are reported as a miss but stay stored until the
 * next set or clear.
 */
class SatelliteCache {
public:
    explicit SatelliteCache(std::chrono::seconds ttl = std::chrono::seconds(3600), Clock clock = systemClock());
    ~SatelliteCache() = default;

    /**
     * Cached set, if it was stored less than ttl ago.
     */
    std::optional<SharedSatelliteSet> get(const std::string &scenarioID) const;

    /**
     * Stores a set, replacing any existing entry, stamped with the current time.
     */
    void set(const std::string &scenarioID, SharedSatelliteSet satellites);

    void clear();
    std::size_t size() const;

    std::chrono::seconds getTTL() const;

private:
    struct Entry {
        SharedSatelliteSet satellites;
        time_point cachedAt;
    };

    std::chrono::seconds ttl;
    Clock clock;
    std::map<std::string, Entry> entries;
};

}

#endif

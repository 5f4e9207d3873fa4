/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <orbitcast/cache.hpp>

#include <spdlog/spdlog.h>

using spdlog::debug;

namespace orbitcast {

Clock systemClock() {
    return [] { return std::chrono::system_clock::now(); };
}

SatelliteCache::SatelliteCache(std::chrono::seconds ttl, Clock clock) : ttl(ttl), clock(std::move(clock)) {}

std::optional<SharedSatelliteSet> SatelliteCache::get(const std::string &scenarioID) const {
    auto it = entries.find(scenarioID);
    if (it == entries.end()) {
        return std::nullopt;
    }

    auto age = clock() - it->second.cachedAt;
    if (age >= ttl) {
        debug("Cache entry for {} expired", scenarioID);
        return std::nullopt;
    }
    return it->second.satellites;
}

void SatelliteCache::set(const std::string &scenarioID, SharedSatelliteSet satellites) {
    entries[scenarioID] = Entry{std::move(satellites), clock()};
}

void SatelliteCache::clear() {
    entries.clear();
}

std::size_t SatelliteCache::size() const {
    return entries.size();
}

std::chrono::seconds SatelliteCache::getTTL() const {
    return ttl;
}

}

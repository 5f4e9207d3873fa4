/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __ORBITCAST_HPP
#define __ORBITCAST_HPP

#include <orbitcast/config.hpp>
#include <orbitcast/elements.hpp>
#include <orbitcast/tle.hpp>
#include <orbitcast/propagator.hpp>
#include <orbitcast/generator.hpp>
#include <orbitcast/scenario.hpp>
#include <orbitcast/cache.hpp>
#include <orbitcast/catalog.hpp>
#include <orbitcast/delivery.hpp>
#include <orbitcast/streamer.hpp>
#include <orbitcast/json.hpp>
#include <orbitcast/celestrak.hpp>

#endif

// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Geoplace - GeoNames place lookup service
 * Copyright (C) 2024 Max Qian
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 */

#include "timezone.hpp"

#include <stdexcept>

#include <date/tz.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include "exception/exception.hpp"

namespace geoplace::service {

namespace {

auto database() -> const date::tzdb& {
    try {
        return date::get_tzdb();
    } catch (const std::runtime_error& e) {
        spdlog::critical("Failed to load timezone database: {}", e.what());
        THROW_DATASET_UNAVAILABLE("Timezone database unavailable: ",
                                  e.what());
    }
}

}  // namespace

void loadTimezoneDatabase() {
    const auto& db = database();
    spdlog::info("Timezone database {} loaded with {} zones", db.version,
                 db.zones.size());
}

auto utcOffset(const std::string& timezone,
               std::chrono::system_clock::time_point instant)
    -> std::chrono::minutes {
    const auto& db = database();
    const date::time_zone* zone = nullptr;
    try {
        zone = db.locate_zone(timezone);
    } catch (const std::runtime_error& e) {
        spdlog::error("Unknown timezone '{}': {}", timezone, e.what());
        THROW_TIMEZONE_LOOKUP("Unknown timezone: ", timezone);
    }

    auto info = zone->get_info(date::floor<std::chrono::seconds>(instant));
    return std::chrono::duration_cast<std::chrono::minutes>(info.offset);
}

auto formatOffset(std::chrono::minutes offset) -> std::string {
    const auto total = offset.count();
    const auto magnitude = total < 0 ? -total : total;
    return fmt::format("{}{:02}:{:02}", total >= 0 ? '+' : '-',
                       magnitude / 60, magnitude % 60);
}

}  // namespace geoplace::service

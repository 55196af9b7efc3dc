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

#ifndef GEOPLACE_PLACE_SERVICE_TIMEZONE_HPP
#define GEOPLACE_PLACE_SERVICE_TIMEZONE_HPP

#include <chrono>
#include <string>

namespace geoplace::service {

/**
 * @brief Load the IANA timezone database
 *
 * The database is parsed once per process. Calling this during startup
 * keeps the parse out of the first comparison request.
 *
 * @throws DatasetUnavailableError if the database cannot be read
 */
void loadTimezoneDatabase();

/**
 * @brief UTC offset of an IANA timezone at a given instant
 *
 * Looked up from the timezone database on every call; daylight-saving
 * rules make the result depend on `instant`.
 *
 * @param timezone IANA identifier such as "Europe/Moscow"
 * @param instant Point in time to evaluate the offset at
 * @return Offset east of UTC, in whole minutes
 * @throws TimezoneLookupError if the identifier is unknown
 * @throws DatasetUnavailableError if the database cannot be read
 */
[[nodiscard]] auto utcOffset(const std::string& timezone,
                             std::chrono::system_clock::time_point instant)
    -> std::chrono::minutes;

/**
 * @brief Format a signed offset as "+HH:MM" or "-HH:MM"
 *
 * Zero is rendered as "+00:00".
 */
[[nodiscard]] auto formatOffset(std::chrono::minutes offset) -> std::string;

}  // namespace geoplace::service

#endif  // GEOPLACE_PLACE_SERVICE_TIMEZONE_HPP

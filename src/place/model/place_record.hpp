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

#ifndef GEOPLACE_PLACE_MODEL_PLACE_RECORD_HPP
#define GEOPLACE_PLACE_MODEL_PLACE_RECORD_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace geoplace::model {

/// Feature class marking a populated place (city, town, village)
inline constexpr std::string_view kPopulatedPlaceClass = "P";

/// Number of tab-separated columns in a dataset row
inline constexpr std::size_t kFieldCount = 19;

/**
 * @brief One populated place from the GeoNames dataset
 *
 * Column order follows the dataset schema:
 * geonameid, name, asciiname, alternatenames, latitude, longitude,
 * feature class, feature code, country code, cc2, admin1..admin4 codes,
 * population, elevation, dem, timezone, modification date.
 *
 * Records are created once while the index is built and are never
 * modified afterwards; indices share them through PlaceRef.
 */
struct PlaceRecord {
    int64_t id = 0;                           ///< geonameid, primary key
    std::string name;                         ///< Canonical name (UTF-8)
    std::string asciiName;                    ///< Plain ASCII name
    std::vector<std::string> alternateNames;  ///< Aliases, duplicates kept
    double latitude = 0.0;                    ///< Decimal degrees (WGS84)
    double longitude = 0.0;                   ///< Decimal degrees (WGS84)
    std::string featureClass;                 ///< One-letter class code
    std::string featureCode;                  ///< Up to ten letters
    std::string countryCode;                  ///< ISO-3166 alpha-2
    std::string cc2;                          ///< Alternate country codes
    std::string admin1Code;
    std::string admin2Code;
    std::string admin3Code;
    std::string admin4Code;
    int64_t population = 0;
    std::optional<int32_t> elevation;  ///< Metres, often absent
    int32_t dem = 0;                   ///< Digital elevation model, metres
    std::string timezone;              ///< IANA timezone identifier
    std::string modificationDate;      ///< yyyy-MM-dd

    /**
     * @brief Whether the feature class denotes a populated place
     */
    [[nodiscard]] auto isPopulatedPlace() const -> bool {
        return featureClass == kPopulatedPlaceClass;
    }

    /**
     * @brief Alternate names joined back into the dataset's comma form
     */
    [[nodiscard]] auto joinedAlternateNames() const -> std::string;

    /**
     * @brief Serialize to JSON using the dataset's column names
     *
     * @return JSON object representation
     */
    [[nodiscard]] auto toJson() const -> nlohmann::json;
};

/// Shared, immutable handle to a record held by the indices
using PlaceRef = std::shared_ptr<const PlaceRecord>;

/**
 * @brief Outcome of comparing two places by name
 *
 * Transient value produced per query, never stored.
 */
struct ComparisonResult {
    std::string north;         ///< The input name whose place lies further north
    bool isSameTime = false;   ///< Both timezones share the current UTC offset
    std::string timezoneDiff;  ///< Offset difference as "+HH:MM" / "-HH:MM"
    int diffMinutes = 0;       ///< offset(first) - offset(second), minutes
    PlaceRef first;            ///< Place resolved for the first name
    PlaceRef second;           ///< Place resolved for the second name

    [[nodiscard]] auto toJson() const -> nlohmann::json;
};

}  // namespace geoplace::model

#endif  // GEOPLACE_PLACE_MODEL_PLACE_RECORD_HPP

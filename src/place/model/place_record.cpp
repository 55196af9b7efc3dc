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

#include "place_record.hpp"

#include <nlohmann/json.hpp>

namespace geoplace::model {

auto PlaceRecord::joinedAlternateNames() const -> std::string {
    std::string joined;
    for (size_t i = 0; i < alternateNames.size(); ++i) {
        if (i > 0) {
            joined += ',';
        }
        joined += alternateNames[i];
    }
    return joined;
}

auto PlaceRecord::toJson() const -> nlohmann::json {
    nlohmann::json j;
    j["geonameid"] = id;
    j["name"] = name;
    j["asciiname"] = asciiName;
    j["alternatenames"] = joinedAlternateNames();
    j["latitude"] = latitude;
    j["longitude"] = longitude;
    j["feature_class"] = featureClass;
    j["feature_code"] = featureCode;
    j["country_code"] = countryCode;
    j["cc2"] = cc2;
    j["admin1_code"] = admin1Code;
    j["admin2_code"] = admin2Code;
    j["admin3_code"] = admin3Code;
    j["admin4_code"] = admin4Code;
    j["population"] = population;
    if (elevation) {
        j["elevation"] = *elevation;
    } else {
        j["elevation"] = nullptr;
    }
    j["dem"] = dem;
    j["timezone"] = timezone;
    j["modification_date"] = modificationDate;
    return j;
}

auto ComparisonResult::toJson() const -> nlohmann::json {
    nlohmann::json j;
    j["north"] = north;
    j["is_same_time"] = isSameTime;
    j["timezone_diff"] = timezoneDiff;
    j["name_1"] = first ? first->toJson() : nlohmann::json(nullptr);
    j["name_2"] = second ? second->toJson() : nlohmann::json(nullptr);
    return j;
}

}  // namespace geoplace::model

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

#include "dataset_reader.hpp"

#include <charconv>
#include <filesystem>
#include <system_error>

#include <spdlog/spdlog.h>

#include "exception/exception.hpp"

namespace geoplace::io {

namespace {

/// Column positions in a dataset row
enum Column : size_t {
    kId = 0,
    kName,
    kAsciiName,
    kAlternateNames,
    kLatitude,
    kLongitude,
    kFeatureClass,
    kFeatureCode,
    kCountryCode,
    kCc2,
    kAdmin1,
    kAdmin2,
    kAdmin3,
    kAdmin4,
    kPopulation,
    kElevation,
    kDem,
    kTimezone,
    kModificationDate
};

static_assert(kModificationDate + 1 == model::kFieldCount);

template <typename Int>
auto parseInteger(std::string_view text, std::string_view column,
                  size_t lineNumber) -> Int {
    Int value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(),
                                     value);
    if (text.empty() || ec != std::errc() ||
        ptr != text.data() + text.size()) {
        THROW_MALFORMED_RECORD("Line ", lineNumber, ": column '", column,
                               "' is not an integer: '", std::string(text),
                               "'");
    }
    return value;
}

auto parseDecimal(std::string_view text, std::string_view column,
                  size_t lineNumber) -> double {
    double value = 0.0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(),
                                     value);
    if (text.empty() || ec != std::errc() ||
        ptr != text.data() + text.size()) {
        THROW_MALFORMED_RECORD("Line ", lineNumber, ": column '", column,
                               "' is not a decimal number: '",
                               std::string(text), "'");
    }
    return value;
}

auto splitAlternateNames(std::string_view text) -> std::vector<std::string> {
    std::vector<std::string> names;
    size_t start = 0;
    while (start <= text.size()) {
        size_t comma = text.find(',', start);
        if (comma == std::string_view::npos) {
            comma = text.size();
        }
        if (comma > start) {
            names.emplace_back(text.substr(start, comma - start));
        }
        start = comma + 1;
    }
    return names;
}

}  // namespace

auto DatasetReader::splitFields(std::string_view line)
    -> std::vector<std::string_view> {
    std::vector<std::string_view> fields;
    fields.reserve(model::kFieldCount);

    size_t start = 0;
    while (true) {
        size_t tab = line.find('\t', start);
        if (tab == std::string_view::npos) {
            fields.push_back(line.substr(start));
            break;
        }
        fields.push_back(line.substr(start, tab - start));
        start = tab + 1;
    }
    return fields;
}

auto DatasetReader::parseLine(std::string_view line, size_t lineNumber)
    -> PlaceRecord {
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }

    auto fields = splitFields(line);
    if (fields.size() != model::kFieldCount) {
        THROW_MALFORMED_RECORD("Line ", lineNumber, ": expected ",
                               model::kFieldCount, " columns, found ",
                               fields.size());
    }

    PlaceRecord record;
    record.id = parseInteger<int64_t>(fields[kId], "geonameid", lineNumber);
    if (record.id < 0) {
        THROW_MALFORMED_RECORD("Line ", lineNumber,
                               ": geonameid must be non-negative");
    }
    record.name = fields[kName];
    record.asciiName = fields[kAsciiName];
    record.alternateNames = splitAlternateNames(fields[kAlternateNames]);
    record.latitude = parseDecimal(fields[kLatitude], "latitude", lineNumber);
    record.longitude =
        parseDecimal(fields[kLongitude], "longitude", lineNumber);
    record.featureClass = fields[kFeatureClass];
    record.featureCode = fields[kFeatureCode];
    record.countryCode = fields[kCountryCode];
    record.cc2 = fields[kCc2];
    record.admin1Code = fields[kAdmin1];
    record.admin2Code = fields[kAdmin2];
    record.admin3Code = fields[kAdmin3];
    record.admin4Code = fields[kAdmin4];
    record.population =
        parseInteger<int64_t>(fields[kPopulation], "population", lineNumber);
    if (record.population < 0) {
        THROW_MALFORMED_RECORD("Line ", lineNumber,
                               ": population must be non-negative");
    }
    if (!fields[kElevation].empty()) {
        record.elevation = parseInteger<int32_t>(fields[kElevation],
                                                 "elevation", lineNumber);
    }
    record.dem = parseInteger<int32_t>(fields[kDem], "dem", lineNumber);
    record.timezone = fields[kTimezone];
    record.modificationDate = fields[kModificationDate];
    return record;
}

auto DatasetReader::forEachLine(std::istream& input,
                                const LineHandler& handler) -> size_t {
    std::string line;
    size_t lineNumber = 0;
    size_t handled = 0;

    while (std::getline(input, line)) {
        ++lineNumber;
        if (line.empty() || line == "\r") {
            spdlog::trace("Skipping blank line {}", lineNumber);
            continue;
        }
        handler(line, lineNumber);
        ++handled;
    }

    if (input.bad()) {
        THROW_DATASET_UNAVAILABLE("Read error after line ", lineNumber);
    }
    return handled;
}

auto DatasetReader::open(const std::string& path) -> std::ifstream {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        THROW_DATASET_UNAVAILABLE("Dataset file not found: ", path);
    }

    std::ifstream stream(path);
    if (!stream.is_open()) {
        THROW_DATASET_UNAVAILABLE("Failed to open dataset file: ", path);
    }

    spdlog::info("Opened dataset file: {}", path);
    return stream;
}

}  // namespace geoplace::io

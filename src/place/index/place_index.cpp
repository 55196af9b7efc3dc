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

#include "place_index.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "../io/dataset_reader.hpp"

namespace geoplace::index {

auto IndexStats::toJson() const -> nlohmann::json {
    return nlohmann::json{{"linesRead", linesRead},
                          {"retained", retained},
                          {"skippedByClass", skippedByClass},
                          {"duplicateIds", duplicateIds},
                          {"distinctNames", distinctNames},
                          {"nameEntries", nameEntries},
                          {"trieNodes", trieNodes},
                          {"buildTimeMs", buildTime.count()}};
}

PlaceIndex::PlaceIndex(PrimaryIndex primary, NameIndex names,
                       IndexStats stats)
    : primary_(std::move(primary)),
      names_(std::move(names)),
      stats_(stats) {}

/**
 * @brief Accumulates records line by line, then freezes them into a
 * PlaceIndex
 */
class Indexer::Builder {
public:
    Builder() : started_(std::chrono::steady_clock::now()) {}

    void addLine(std::string_view line, size_t lineNumber) {
        auto record = io::DatasetReader::parseLine(line, lineNumber);
        ++stats_.linesRead;

        if (!record.isPopulatedPlace()) {
            ++stats_.skippedByClass;
            return;
        }

        const int64_t id = record.id;
        if (!primary_.upsert(
                std::make_shared<const PlaceRecord>(std::move(record)))) {
            ++stats_.duplicateIds;
            spdlog::warn("Duplicate geonameid {} on line {}, keeping the later "
                         "record",
                         id, lineNumber);
        }
    }

    auto finish() && -> PlaceIndex {
        stats_.retained = primary_.size();
        auto names = NameIndex::build(primary_);
        stats_.distinctNames = names.size();
        stats_.nameEntries = names.entryCount();
        stats_.trieNodes = names.prefixNodes();
        stats_.buildTime =
            std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - started_);

        spdlog::info(
            "Place index built in {} ms: {} lines, {} places retained, {} "
            "skipped by feature class, {} duplicate ids",
            stats_.buildTime.count(), stats_.linesRead, stats_.retained,
            stats_.skippedByClass, stats_.duplicateIds);

        return PlaceIndex(std::move(primary_), std::move(names), stats_);
    }

private:
    std::chrono::steady_clock::time_point started_;
    PrimaryIndex primary_;
    IndexStats stats_;
};

auto Indexer::build(std::span<const std::string> lines) -> PlaceIndex {
    Builder builder;
    size_t lineNumber = 0;
    for (const auto& line : lines) {
        ++lineNumber;
        if (line.empty() || line == "\r") {
            continue;
        }
        builder.addLine(line, lineNumber);
    }
    return std::move(builder).finish();
}

auto Indexer::build(std::istream& input) -> PlaceIndex {
    Builder builder;
    io::DatasetReader::forEachLine(
        input, [&builder](std::string_view line, size_t lineNumber) {
            builder.addLine(line, lineNumber);
        });
    return std::move(builder).finish();
}

auto Indexer::loadFile(const std::string& path)
    -> std::shared_ptr<const PlaceIndex> {
    spdlog::info("Loading places from {}", path);
    auto stream = io::DatasetReader::open(path);
    return std::make_shared<const PlaceIndex>(build(stream));
}

}  // namespace geoplace::index

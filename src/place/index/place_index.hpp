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

#ifndef GEOPLACE_PLACE_INDEX_PLACE_INDEX_HPP
#define GEOPLACE_PLACE_INDEX_PLACE_INDEX_HPP

#include <chrono>
#include <cstddef>
#include <istream>
#include <memory>
#include <span>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include "name_index.hpp"
#include "primary_index.hpp"

namespace geoplace::index {

/**
 * @brief Figures collected while the index is built
 */
struct IndexStats {
    size_t linesRead = 0;        ///< Non-blank dataset lines parsed
    size_t retained = 0;         ///< Records stored in the primary index
    size_t skippedByClass = 0;   ///< Rows that are not populated places
    size_t duplicateIds = 0;     ///< Rows that overwrote an earlier id
    size_t distinctNames = 0;    ///< Keys of the name index
    size_t nameEntries = 0;      ///< (name, record) pairs, duplicates included
    size_t trieNodes = 0;
    std::chrono::milliseconds buildTime{0};

    [[nodiscard]] auto toJson() const -> nlohmann::json;
};

/**
 * @brief Immutable pair of indices over the populated places
 *
 * Constructed once at startup by Indexer and shared read-only by every
 * query for the rest of the process. Both indices hold the same records.
 */
class PlaceIndex {
public:
    PlaceIndex(PrimaryIndex primary, NameIndex names, IndexStats stats);

    PlaceIndex(const PlaceIndex&) = delete;
    PlaceIndex& operator=(const PlaceIndex&) = delete;
    PlaceIndex(PlaceIndex&&) = default;
    PlaceIndex& operator=(PlaceIndex&&) = default;

    [[nodiscard]] auto primary() const -> const PrimaryIndex& {
        return primary_;
    }
    [[nodiscard]] auto names() const -> const NameIndex& { return names_; }
    [[nodiscard]] auto stats() const -> const IndexStats& { return stats_; }

private:
    PrimaryIndex primary_;
    NameIndex names_;
    IndexStats stats_;
};

/**
 * @brief Builds a PlaceIndex from dataset rows
 *
 * Rows are parsed and filtered to populated places in a single pass. A
 * duplicate id overwrites the earlier record (the overwrite is logged).
 * The name index is built afterwards from the surviving records.
 *
 * @example
 * ```cpp
 * auto index = Indexer::loadFile("RU.txt");
 * QueryService service(index);
 * ```
 */
class Indexer {
public:
    /**
     * @brief Build from rows already in memory
     *
     * @throws MalformedRecordError if any row fails to parse
     */
    [[nodiscard]] static auto build(std::span<const std::string> lines)
        -> PlaceIndex;

    /**
     * @brief Build from a stream, read once sequentially
     *
     * @throws MalformedRecordError if any row fails to parse
     * @throws DatasetUnavailableError if the stream fails
     */
    [[nodiscard]] static auto build(std::istream& input) -> PlaceIndex;

    /**
     * @brief Open a dataset file and build the shared index from it
     *
     * @throws DatasetUnavailableError if the file cannot be read
     * @throws MalformedRecordError if any row fails to parse
     */
    [[nodiscard]] static auto loadFile(const std::string& path)
        -> std::shared_ptr<const PlaceIndex>;

private:
    class Builder;
};

}  // namespace geoplace::index

#endif  // GEOPLACE_PLACE_INDEX_PLACE_INDEX_HPP

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

#ifndef GEOPLACE_PLACE_INDEX_PRIMARY_INDEX_HPP
#define GEOPLACE_PLACE_INDEX_PRIMARY_INDEX_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

#include "../model/place_record.hpp"

namespace geoplace::index {

using model::PlaceRecord;
using model::PlaceRef;

/**
 * @brief Insertion-ordered map from geonameid to place record
 *
 * Iteration and paging follow the order in which ids were first seen.
 * Re-inserting an existing id replaces the stored record but keeps its
 * original position.
 */
class PrimaryIndex {
public:
    using const_iterator = std::vector<PlaceRef>::const_iterator;

    /**
     * @brief Insert or overwrite a record keyed by its id
     *
     * @param record Record to store
     * @return true if the id was new, false if an earlier record was replaced
     */
    auto upsert(PlaceRef record) -> bool;

    /**
     * @brief Look up a record by id
     */
    [[nodiscard]] auto find(int64_t id) const -> std::optional<PlaceRef>;

    /**
     * @brief Slice of the insertion order
     *
     * @param skip Number of leading records to skip
     * @param limit Maximum number of records to return
     * @return Up to `limit` records; empty when `skip` is past the end
     */
    [[nodiscard]] auto page(size_t skip, size_t limit) const
        -> std::vector<PlaceRef>;

    [[nodiscard]] auto size() const -> size_t { return ordered_.size(); }
    [[nodiscard]] auto empty() const -> bool { return ordered_.empty(); }

    [[nodiscard]] auto begin() const -> const_iterator {
        return ordered_.begin();
    }
    [[nodiscard]] auto end() const -> const_iterator { return ordered_.end(); }

private:
    std::vector<PlaceRef> ordered_;
    std::unordered_map<int64_t, size_t> slots_;
};

}  // namespace geoplace::index

#endif  // GEOPLACE_PLACE_INDEX_PRIMARY_INDEX_HPP

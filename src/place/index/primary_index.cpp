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

#include "primary_index.hpp"

#include <algorithm>

namespace geoplace::index {

auto PrimaryIndex::upsert(PlaceRef record) -> bool {
    const int64_t id = record->id;
    auto [it, inserted] = slots_.try_emplace(id, ordered_.size());
    if (inserted) {
        ordered_.push_back(std::move(record));
    } else {
        ordered_[it->second] = std::move(record);
    }
    return inserted;
}

auto PrimaryIndex::find(int64_t id) const -> std::optional<PlaceRef> {
    auto it = slots_.find(id);
    if (it == slots_.end()) {
        return std::nullopt;
    }
    return ordered_[it->second];
}

auto PrimaryIndex::page(size_t skip, size_t limit) const
    -> std::vector<PlaceRef> {
    if (skip >= ordered_.size()) {
        return {};
    }
    size_t count = std::min(limit, ordered_.size() - skip);
    auto first = ordered_.begin() + static_cast<std::ptrdiff_t>(skip);
    return {first, first + static_cast<std::ptrdiff_t>(count)};
}

}  // namespace geoplace::index

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

#include "name_index.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace geoplace::index {

auto NameIndex::build(const PrimaryIndex& primary) -> NameIndex {
    NameIndex index;

    std::vector<PlaceRef> ranked(primary.begin(), primary.end());
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const PlaceRef& a, const PlaceRef& b) {
                         return a->population < b->population;
                     });

    for (const auto& record : ranked) {
        for (const auto& name : record->alternateNames) {
            auto& bucket = index.byName_[name];
            if (bucket.empty()) {
                index.prefixes_.insert(name);
            }
            bucket.push_back(record);
            ++index.entryCount_;
        }
    }

    spdlog::info("Name index built: {} distinct names, {} entries",
                 index.byName_.size(), index.entryCount_);
    return index;
}

auto NameIndex::best(std::string_view name) const -> std::optional<PlaceRef> {
    auto matches = candidates(name);
    if (matches.empty()) {
        return std::nullopt;
    }
    return matches.back();
}

auto NameIndex::candidates(std::string_view name) const
    -> std::span<const PlaceRef> {
    auto it = byName_.find(std::string(name));
    if (it == byName_.end()) {
        return {};
    }
    return it->second;
}

auto NameIndex::withPrefix(std::string_view prefix, size_t limit) const
    -> std::vector<std::string> {
    return prefixes_.withPrefix(prefix, limit);
}

}  // namespace geoplace::index

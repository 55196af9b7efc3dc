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

#include "query_service.hpp"

#include <spdlog/spdlog.h>

#include "exception/exception.hpp"
#include "timezone.hpp"

namespace geoplace::service {

QueryService::QueryService(std::shared_ptr<const index::PlaceIndex> index)
    : index_(std::move(index)) {
    if (!index_) {
        THROW_INVALID_ARGUMENT("QueryService requires a place index");
    }
    spdlog::info("QueryService ready with {} places", index_->primary().size());
}

void QueryService::validateLimit(int64_t limit) {
    if (limit <= 0 || limit > kMaxLimit) {
        THROW_INVALID_QUERY("limit must satisfy 0 < limit <= ", kMaxLimit,
                            ", got ", limit);
    }
}

auto QueryService::getById(int64_t id) const -> std::optional<PlaceRef> {
    if (id < 0) {
        THROW_INVALID_QUERY("id must be >= 0, got ", id);
    }
    spdlog::debug("Looking up place id {}", id);
    return index_->primary().find(id);
}

auto QueryService::getPage(int64_t skip, int64_t limit) const
    -> std::vector<PlaceRef> {
    if (skip < 0) {
        THROW_INVALID_QUERY("skip must be >= 0, got ", skip);
    }
    validateLimit(limit);
    spdlog::debug("Listing places skip={} limit={}", skip, limit);
    return index_->primary().page(static_cast<size_t>(skip),
                                  static_cast<size_t>(limit));
}

auto QueryService::getByName(std::string_view name) const
    -> std::optional<PlaceRef> {
    spdlog::debug("Resolving place name '{}'", name);
    return index_->names().best(name);
}

auto QueryService::candidates(std::string_view name) const
    -> std::span<const PlaceRef> {
    return index_->names().candidates(name);
}

auto QueryService::prefixSearch(std::string_view prefix, int64_t limit) const
    -> std::vector<std::string> {
    if (prefix.empty()) {
        THROW_INVALID_QUERY("prefix must not be empty");
    }
    validateLimit(limit);
    spdlog::debug("Prefix search '{}' limit={}", prefix, limit);
    return index_->names().withPrefix(prefix, static_cast<size_t>(limit));
}

auto QueryService::compare(std::string_view name1,
                           std::string_view name2) const
    -> std::optional<ComparisonResult> {
    return compare(name1, name2, std::chrono::system_clock::now());
}

auto QueryService::compare(std::string_view name1, std::string_view name2,
                           std::chrono::system_clock::time_point instant) const
    -> std::optional<ComparisonResult> {
    auto first = getByName(name1);
    auto second = getByName(name2);
    if (!first || !second) {
        spdlog::debug("Comparison '{}' vs '{}': unresolved name", name1,
                      name2);
        return std::nullopt;
    }

    auto diff = utcOffset((*first)->timezone, instant) -
                utcOffset((*second)->timezone, instant);

    ComparisonResult result;
    result.north = (*first)->latitude >= (*second)->latitude
                       ? std::string(name1)
                       : std::string(name2);
    result.diffMinutes = static_cast<int>(diff.count());
    result.isSameTime = diff.count() == 0;
    result.timezoneDiff = formatOffset(diff);
    result.first = std::move(*first);
    result.second = std::move(*second);
    return result;
}

auto QueryService::size() const -> size_t { return index_->primary().size(); }

}  // namespace geoplace::service

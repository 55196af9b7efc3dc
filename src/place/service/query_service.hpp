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

#ifndef GEOPLACE_PLACE_SERVICE_QUERY_SERVICE_HPP
#define GEOPLACE_PLACE_SERVICE_QUERY_SERVICE_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "../index/place_index.hpp"
#include "../model/place_record.hpp"

namespace geoplace::service {

using model::ComparisonResult;
using model::PlaceRef;

/// Upper bound for page sizes and prefix-search result counts
inline constexpr int64_t kMaxLimit = 1000;

/**
 * @brief Read-only queries over a PlaceIndex
 *
 * Holds the shared index for its whole lifetime and never modifies it,
 * so one instance may serve concurrent requests without locking.
 *
 * Invalid input raises InvalidQueryError before the index is touched. A
 * well-formed query without a match yields std::nullopt (or an empty
 * sequence for listings).
 *
 * Usage:
 * @code
 * QueryService service(Indexer::loadFile("RU.txt"));
 * if (auto place = service.getByName("Moskva")) {
 *     spdlog::info("{} has {} inhabitants", (*place)->name,
 *                  (*place)->population);
 * }
 * auto result = service.compare("Moscow", "Saint Petersburg");
 * @endcode
 */
class QueryService {
public:
    /**
     * @brief Construct over a built index
     *
     * @param index Shared index; must not be null
     */
    explicit QueryService(std::shared_ptr<const index::PlaceIndex> index);

    /**
     * @brief Look up a place by geonameid
     *
     * @param id Identifier, must be >= 0
     * @return The place, or std::nullopt if the id is unknown
     * @throws InvalidQueryError if id is negative
     */
    [[nodiscard]] auto getById(int64_t id) const -> std::optional<PlaceRef>;

    /**
     * @brief List places in index order
     *
     * @param skip Records to skip, must be >= 0
     * @param limit Page size, must be in (0, kMaxLimit]
     * @return Up to `limit` places; empty when `skip` is past the end
     * @throws InvalidQueryError on out-of-range arguments
     */
    [[nodiscard]] auto getPage(int64_t skip, int64_t limit) const
        -> std::vector<PlaceRef>;

    /**
     * @brief Most populous place carrying an alternate name
     *
     * @param name Exact, case-sensitive name
     * @return The place, or std::nullopt if no place has that name
     */
    [[nodiscard]] auto getByName(std::string_view name) const
        -> std::optional<PlaceRef>;

    /**
     * @brief Every place sharing an alternate name, ascending by population
     */
    [[nodiscard]] auto candidates(std::string_view name) const
        -> std::span<const PlaceRef>;

    /**
     * @brief Autocomplete alternate names
     *
     * @param prefix Non-empty, case-sensitive prefix
     * @param limit Maximum result count, must be in (0, kMaxLimit]
     * @return Distinct names starting with `prefix`, at most `limit`
     * @throws InvalidQueryError on empty prefix or out-of-range limit
     */
    [[nodiscard]] auto prefixSearch(std::string_view prefix,
                                    int64_t limit) const
        -> std::vector<std::string>;

    /**
     * @brief Compare two places by name at the current instant
     *
     * The clock is read once per call and both offsets are evaluated at
     * that instant.
     *
     * @return The comparison, or std::nullopt if either name is unknown
     * @throws TimezoneLookupError if a place carries an unknown timezone
     */
    [[nodiscard]] auto compare(std::string_view name1,
                               std::string_view name2) const
        -> std::optional<ComparisonResult>;

    /**
     * @brief Compare two places by name at a given instant
     */
    [[nodiscard]] auto compare(std::string_view name1, std::string_view name2,
                               std::chrono::system_clock::time_point instant)
        const -> std::optional<ComparisonResult>;

    /// Number of places in the primary index
    [[nodiscard]] auto size() const -> size_t;

    [[nodiscard]] auto placeIndex() const -> const index::PlaceIndex& {
        return *index_;
    }

private:
    static void validateLimit(int64_t limit);

    std::shared_ptr<const index::PlaceIndex> index_;
};

}  // namespace geoplace::service

#endif  // GEOPLACE_PLACE_SERVICE_QUERY_SERVICE_HPP

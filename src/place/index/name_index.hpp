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

#ifndef GEOPLACE_PLACE_INDEX_NAME_INDEX_HPP
#define GEOPLACE_PLACE_INDEX_NAME_INDEX_HPP

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "primary_index.hpp"
#include "trie_index.hpp"

namespace geoplace::index {

/**
 * @brief Alternate-name index with population-ranked collisions
 *
 * Every alternate name of every record maps to the list of records
 * carrying it. Lists are ordered by ascending population, so the last
 * entry is the most populous place with that name. Places with equal
 * population keep their primary-index order, which makes the later one
 * the winner. A record listing the same alias twice appears twice.
 *
 * The prefix trie over the distinct names is built alongside and serves
 * autocompletion.
 */
class NameIndex {
public:
    NameIndex() = default;

    /**
     * @brief Build the index from every record of a primary index
     *
     * @param primary Source records
     * @return Fully built, read-only index
     */
    [[nodiscard]] static auto build(const PrimaryIndex& primary) -> NameIndex;

    /**
     * @brief Most populous record for an exact, case-sensitive name
     */
    [[nodiscard]] auto best(std::string_view name) const
        -> std::optional<PlaceRef>;

    /**
     * @brief All records sharing a name, ascending by population
     *
     * @return Empty span if the name is unknown
     */
    [[nodiscard]] auto candidates(std::string_view name) const
        -> std::span<const PlaceRef>;

    /**
     * @brief Up to `limit` distinct names starting with `prefix`
     */
    [[nodiscard]] auto withPrefix(std::string_view prefix, size_t limit) const
        -> std::vector<std::string>;

    /// Number of distinct names
    [[nodiscard]] auto size() const -> size_t { return byName_.size(); }

    /// Number of (name, record) entries, duplicates included
    [[nodiscard]] auto entryCount() const -> size_t { return entryCount_; }

    /// Nodes in the prefix trie, root included
    [[nodiscard]] auto prefixNodes() const -> size_t {
        return prefixes_.size();
    }

private:
    std::unordered_map<std::string, std::vector<PlaceRef>> byName_;
    TrieIndex prefixes_;
    size_t entryCount_ = 0;
};

}  // namespace geoplace::index

#endif  // GEOPLACE_PLACE_INDEX_NAME_INDEX_HPP

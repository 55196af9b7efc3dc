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

#ifndef GEOPLACE_PLACE_INDEX_TRIE_INDEX_HPP
#define GEOPLACE_PLACE_INDEX_TRIE_INDEX_HPP

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace geoplace::index {

/**
 * @brief Byte-wise prefix tree over place names
 *
 * Filled once while the name index is built and only read afterwards, so
 * lookups take no lock. Children are kept in byte order; a prefix query
 * therefore yields names in the same order as std::string comparison.
 *
 * @example
 * ```cpp
 * TrieIndex trie;
 * trie.insert("Moscow");
 * trie.insert("Moskva");
 * auto names = trie.withPrefix("Mos", 10);  // ["Moscow", "Moskva"]
 * ```
 */
class TrieIndex {
public:
    TrieIndex();
    ~TrieIndex();

    TrieIndex(const TrieIndex&) = delete;
    TrieIndex& operator=(const TrieIndex&) = delete;

    TrieIndex(TrieIndex&&) noexcept;
    TrieIndex& operator=(TrieIndex&&) noexcept;

    /**
     * @brief Insert a word; inserting an existing word is a no-op
     *
     * @param word The word to insert
     * @return true if the word was not present before
     */
    auto insert(std::string_view word) -> bool;

    /**
     * @brief Collect up to `limit` words starting with `prefix`
     *
     * Traversal stops as soon as `limit` words are found.
     *
     * @param prefix Byte prefix to match (case-sensitive)
     * @param limit Maximum number of words to return
     * @return Matching words in byte-lexicographic order
     */
    [[nodiscard]] auto withPrefix(std::string_view prefix, size_t limit) const
        -> std::vector<std::string>;

    /**
     * @brief Total number of nodes, root included
     */
    [[nodiscard]] auto size() const -> size_t;

private:
    struct TrieNode {
        std::map<unsigned char, std::unique_ptr<TrieNode>> children;
        bool isEndOfWord = false;
    };

    [[nodiscard]] auto findNode(std::string_view prefix) const
        -> const TrieNode*;

    void dfs(const TrieNode* node, std::string& prefix,
             std::vector<std::string>& out, size_t limit) const;

    [[nodiscard]] auto subtreeSize(const TrieNode* node) const -> size_t;

    std::unique_ptr<TrieNode> root_;
};

}  // namespace geoplace::index

#endif  // GEOPLACE_PLACE_INDEX_TRIE_INDEX_HPP

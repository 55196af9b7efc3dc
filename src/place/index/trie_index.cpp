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

#include "trie_index.hpp"

#include <spdlog/spdlog.h>

namespace geoplace::index {

TrieIndex::TrieIndex() : root_(std::make_unique<TrieNode>()) {}

TrieIndex::~TrieIndex() = default;

TrieIndex::TrieIndex(TrieIndex&&) noexcept = default;

TrieIndex& TrieIndex::operator=(TrieIndex&&) noexcept = default;

auto TrieIndex::insert(std::string_view word) -> bool {
    TrieNode* current = root_.get();
    for (char ch : word) {
        auto& child = current->children[static_cast<unsigned char>(ch)];
        if (!child) {
            child = std::make_unique<TrieNode>();
        }
        current = child.get();
    }

    if (current->isEndOfWord) {
        return false;
    }
    current->isEndOfWord = true;
    return true;
}

auto TrieIndex::withPrefix(std::string_view prefix, size_t limit) const
    -> std::vector<std::string> {
    std::vector<std::string> matches;
    if (limit == 0) {
        return matches;
    }

    const TrieNode* start = findNode(prefix);
    if (start == nullptr) {
        spdlog::debug("Prefix '{}' not found in trie", prefix);
        return matches;
    }

    std::string buffer(prefix);
    dfs(start, buffer, matches, limit);
    return matches;
}

auto TrieIndex::findNode(std::string_view prefix) const -> const TrieNode* {
    const TrieNode* current = root_.get();
    for (char ch : prefix) {
        auto it = current->children.find(static_cast<unsigned char>(ch));
        if (it == current->children.end()) {
            return nullptr;
        }
        current = it->second.get();
    }
    return current;
}

void TrieIndex::dfs(const TrieNode* node, std::string& prefix,
                    std::vector<std::string>& out, size_t limit) const {
    if (out.size() >= limit) {
        return;
    }

    if (node->isEndOfWord) {
        out.push_back(prefix);
    }

    for (const auto& [ch, child] : node->children) {
        if (out.size() >= limit) {
            break;
        }
        prefix.push_back(static_cast<char>(ch));
        dfs(child.get(), prefix, out, limit);
        prefix.pop_back();
    }
}

auto TrieIndex::size() const -> size_t { return subtreeSize(root_.get()); }

auto TrieIndex::subtreeSize(const TrieNode* node) const -> size_t {
    if (!node) {
        return 0;
    }

    size_t size = 1;
    for (const auto& [ch, child] : node->children) {
        size += subtreeSize(child.get());
    }
    return size;
}

}  // namespace geoplace::index

// SPDX-License-Identifier: GPL-3.0-or-later
/**
 * @file place.hpp
 * @brief Main aggregated header for the Geoplace place library.
 *
 * @par Module Architecture:
 * - model/   : PlaceRecord and ComparisonResult
 * - io/      : GeoNames dump parsing
 * - index/   : Primary (id) and name indices, prefix trie, Indexer
 * - service/ : Query service and timezone helpers
 *
 * @copyright Copyright (C) 2024 Max Qian
 */

#pragma once

// ============================================================================
// Model Module
// ============================================================================

#include "model/place_record.hpp"

// ============================================================================
// IO Module
// ============================================================================

#include "io/dataset_reader.hpp"

// ============================================================================
// Index Module
// ============================================================================
// Components:
// - PrimaryIndex: geonameid -> record, insertion ordered
// - NameIndex: alternate name -> records ranked by population
// - TrieIndex: prefix tree for autocomplete
// - Indexer / PlaceIndex: one-shot build of the immutable index pair

#include "index/name_index.hpp"
#include "index/place_index.hpp"
#include "index/primary_index.hpp"
#include "index/trie_index.hpp"

// ============================================================================
// Service Module
// ============================================================================

#include "service/query_service.hpp"
#include "service/timezone.hpp"

#include "exception/exception.hpp"

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

#ifndef GEOPLACE_PLACE_IO_DATASET_READER_HPP
#define GEOPLACE_PLACE_IO_DATASET_READER_HPP

#include <cstddef>
#include <fstream>
#include <functional>
#include <istream>
#include <string>
#include <string_view>
#include <vector>

#include "../model/place_record.hpp"

namespace geoplace::io {

using model::PlaceRecord;

/**
 * @brief Reader for the tab-separated GeoNames dump format
 *
 * Each row carries exactly model::kFieldCount columns. Rows are parsed
 * into PlaceRecord with every typed column validated; a row that does not
 * fit the schema raises MalformedRecordError instead of producing a
 * partially filled record.
 *
 * @example
 * ```cpp
 * auto stream = DatasetReader::open("RU.txt");
 * DatasetReader::forEachLine(stream, [](std::string_view line, size_t no) {
 *     auto record = DatasetReader::parseLine(line, no);
 * });
 * ```
 */
class DatasetReader {
public:
    /// Callback receiving a non-blank line and its 1-based line number
    using LineHandler = std::function<void(std::string_view, size_t)>;

    /**
     * @brief Split a row on tab characters, keeping empty columns
     *
     * @param line Row text without its line terminator
     * @return Column values in order
     */
    [[nodiscard]] static auto splitFields(std::string_view line)
        -> std::vector<std::string_view>;

    /**
     * @brief Parse one dataset row
     *
     * A trailing carriage return is ignored. The alternate-name column is
     * split on commas; empty tokens are dropped, repeated names are kept.
     *
     * @param line Row text
     * @param lineNumber Line number used in error messages
     * @return Parsed record (not yet filtered by feature class)
     * @throws MalformedRecordError on a column count or type mismatch
     */
    [[nodiscard]] static auto parseLine(std::string_view line,
                                        size_t lineNumber = 0) -> PlaceRecord;

    /**
     * @brief Walk a stream once, handing every non-blank line to a callback
     *
     * @param input Source stream, consumed sequentially
     * @param handler Called for each non-blank line
     * @return Number of lines handed to the callback
     * @throws DatasetUnavailableError if the stream fails mid-read
     */
    static auto forEachLine(std::istream& input, const LineHandler& handler)
        -> size_t;

    /**
     * @brief Open a dataset file for reading
     *
     * @param path Filesystem path of the dump
     * @return Open stream positioned at the first row
     * @throws DatasetUnavailableError if the file is missing or unreadable
     */
    [[nodiscard]] static auto open(const std::string& path) -> std::ifstream;
};

}  // namespace geoplace::io

#endif  // GEOPLACE_PLACE_IO_DATASET_READER_HPP

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

#ifndef GEOPLACE_EXCEPTION_EXCEPTION_HPP
#define GEOPLACE_EXCEPTION_EXCEPTION_HPP

#include "atom/error/exception.hpp"

namespace geoplace {

// ============================================================================
// Startup Exceptions
// ============================================================================

/**
 * @brief Thrown when a dataset row does not match the fixed column schema.
 *
 * A single malformed row aborts the whole load; the index is never built
 * from a partially parsed dataset.
 */
class MalformedRecordError : public atom::error::Exception {
public:
    using Exception::Exception;
};

/**
 * @brief Thrown when the dataset file cannot be opened or read.
 */
class DatasetUnavailableError : public atom::error::Exception {
public:
    using Exception::Exception;
};

/**
 * @brief Thrown when a configuration file is unreadable or invalid.
 */
class InvalidConfigError : public atom::error::Exception {
public:
    using Exception::Exception;
};

// ============================================================================
// Query Exceptions
// ============================================================================

/**
 * @brief Thrown when caller input fails validation (negative id, limit out
 * of range, empty prefix). Never used to signal a missing record.
 */
class InvalidQueryError : public atom::error::Exception {
public:
    using Exception::Exception;
};

/**
 * @brief Thrown when a record carries a timezone identifier unknown to the
 * IANA database.
 */
class TimezoneLookupError : public atom::error::Exception {
public:
    using Exception::Exception;
};

}  // namespace geoplace

// ============================================================================
// Convenience Macros
// ============================================================================

#define THROW_MALFORMED_RECORD(...)                                  \
    throw geoplace::MalformedRecordError(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                         ATOM_FUNC_NAME, __VA_ARGS__)

#define THROW_DATASET_UNAVAILABLE(...)                                  \
    throw geoplace::DatasetUnavailableError(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                            ATOM_FUNC_NAME, __VA_ARGS__)

#define THROW_INVALID_CONFIG(...)                                  \
    throw geoplace::InvalidConfigError(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                       ATOM_FUNC_NAME, __VA_ARGS__)

#define THROW_INVALID_QUERY(...)                                  \
    throw geoplace::InvalidQueryError(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                      ATOM_FUNC_NAME, __VA_ARGS__)

#define THROW_TIMEZONE_LOOKUP(...)                                  \
    throw geoplace::TimezoneLookupError(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                        ATOM_FUNC_NAME, __VA_ARGS__)

#endif  // GEOPLACE_EXCEPTION_EXCEPTION_HPP

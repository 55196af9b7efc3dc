/**
 * @file logging.hpp
 * @brief Main aggregated header for Geoplace logging.
 *
 * @par Usage Example:
 * @code
 * #include "logging/logging.hpp"
 *
 * using namespace geoplace::logging;
 *
 * LoggingConfig config;
 * config.default_level = spdlog::level::debug;
 * LoggingManager::getInstance().initialize(config);
 * spdlog::info("Hello, logging!");
 * @endcode
 *
 * @date 2024-11-28
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#ifndef GEOPLACE_LOGGING_LOGGING_HPP
#define GEOPLACE_LOGGING_LOGGING_HPP

#include "logging_manager.hpp"
#include "sinks/sink_factory.hpp"
#include "types.hpp"

#endif  // GEOPLACE_LOGGING_LOGGING_HPP

/*
 * sink_factory.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-28

Description: Factory for creating spdlog sinks from configuration

**************************************************/

#ifndef GEOPLACE_LOGGING_SINKS_SINK_FACTORY_HPP
#define GEOPLACE_LOGGING_SINKS_SINK_FACTORY_HPP

#include <string>

#include <spdlog/sinks/sink.h>
#include <spdlog/spdlog.h>

#include "../types.hpp"

namespace geoplace::logging {

/**
 * @brief Factory class for creating spdlog sinks
 *
 * Supports console (stdout with colors), basic file and rotating file
 * sinks. Parent directories of file sinks are created on demand.
 */
class SinkFactory {
public:
    /**
     * @brief Create a sink from configuration
     * @param config Sink configuration
     * @return Created sink, or nullptr for an unknown type or on failure
     */
    [[nodiscard]] static auto createSink(const SinkConfig& config)
        -> spdlog::sink_ptr;

    [[nodiscard]] static auto createConsoleSink(
        spdlog::level::level_enum level = spdlog::level::trace,
        const std::string& pattern = "") -> spdlog::sink_ptr;

    [[nodiscard]] static auto createFileSink(
        const std::string& file_path,
        spdlog::level::level_enum level = spdlog::level::trace,
        const std::string& pattern = "", bool truncate = false)
        -> spdlog::sink_ptr;

    [[nodiscard]] static auto createRotatingFileSink(
        const std::string& file_path, size_t max_size = 10 * 1024 * 1024,
        size_t max_files = 5,
        spdlog::level::level_enum level = spdlog::level::trace,
        const std::string& pattern = "") -> spdlog::sink_ptr;

private:
    static void ensureDirectoryExists(const std::string& file_path);
};

}  // namespace geoplace::logging

#endif  // GEOPLACE_LOGGING_SINKS_SINK_FACTORY_HPP

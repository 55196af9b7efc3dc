/*
 * types.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-28

Description: Logging system type definitions

**************************************************/

#ifndef GEOPLACE_LOGGING_TYPES_HPP
#define GEOPLACE_LOGGING_TYPES_HPP

#include <cstddef>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace geoplace::logging {

/**
 * @brief Sink configuration structure
 */
struct SinkConfig {
    std::string name;
    std::string type;  // "console", "file", "rotating_file"
    spdlog::level::level_enum level{spdlog::level::trace};
    std::string pattern;

    // File sink options
    std::string file_path;
    size_t max_file_size{10 * 1024 * 1024};  // 10MB default
    size_t max_files{5};

    [[nodiscard]] auto toJson() const -> nlohmann::json;
    [[nodiscard]] static auto fromJson(const nlohmann::json& j) -> SinkConfig;
};

/**
 * @brief Logging configuration
 *
 * When no sinks are listed, a colored console sink plus a rotating file
 * sink under log_dir are created.
 */
struct LoggingConfig {
    spdlog::level::level_enum default_level{spdlog::level::info};
    std::string default_pattern{"[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [%t] %v"};
    std::vector<SinkConfig> sinks;

    bool enable_console{true};
    bool enable_file{true};
    std::string log_dir{"logs"};
    std::string log_filename{"geoplace"};

    [[nodiscard]] auto toJson() const -> nlohmann::json;
    [[nodiscard]] static auto fromJson(const nlohmann::json& j)
        -> LoggingConfig;

    /**
     * @brief Expand the console/file switches into concrete sinks
     */
    [[nodiscard]] auto effectiveSinks() const -> std::vector<SinkConfig>;
};

/**
 * @brief Convert level string to spdlog enum ("info", "warn", ...)
 *
 * Unknown strings map to info.
 */
[[nodiscard]] auto levelFromString(const std::string& level)
    -> spdlog::level::level_enum;

/**
 * @brief Convert spdlog level enum to string
 */
[[nodiscard]] auto levelToString(spdlog::level::level_enum level)
    -> std::string;

}  // namespace geoplace::logging

#endif  // GEOPLACE_LOGGING_TYPES_HPP

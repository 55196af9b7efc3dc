/*
 * server_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-30

Description: Geoplace server configuration

**************************************************/

#ifndef GEOPLACE_CONFIG_SERVER_CONFIG_HPP
#define GEOPLACE_CONFIG_SERVER_CONFIG_HPP

#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "logging/types.hpp"

namespace geoplace::config {

using json = nlohmann::json;

/**
 * @brief Server configuration
 *
 * Values come from defaults, then an optional JSON file, then command
 * line flags, in increasing priority.
 *
 * @example
 * ```json
 * {
 *   "host": "127.0.0.1",
 *   "port": 8000,
 *   "threadCount": 4,
 *   "datasetPath": "RU.txt",
 *   "enableCors": true,
 *   "logging": { "level": "info", "log_dir": "logs" }
 * }
 * ```
 */
struct ServerConfig {
    /// Configuration path
    static constexpr std::string_view PATH = "/geoplace/server";

    std::string host{"127.0.0.1"};  ///< Server bind host
    int port{8000};                 ///< Server port
    int threadCount{4};             ///< Crow worker threads
    std::string datasetPath{"RU.txt"};  ///< GeoNames dump to index at startup
    bool enableCors{true};          ///< Add CORS headers to responses

    logging::LoggingConfig logging;

    [[nodiscard]] json serialize() const;

    [[nodiscard]] static ServerConfig deserialize(const json& j);

    /**
     * @brief Read a JSON configuration file
     *
     * @throws InvalidConfigError if the file is missing or not valid JSON
     */
    [[nodiscard]] static ServerConfig loadFromFile(const std::string& path);

    /**
     * @brief Check value ranges
     *
     * @throws InvalidConfigError naming the first offending field
     */
    void validate() const;
};

/**
 * @brief Result of parsing the command line
 */
struct CommandLine {
    std::string configPath;  ///< Empty when --config was not given
    bool showHelp{false};
    std::vector<std::string> overrides;  ///< Flags that were applied
};

/**
 * @brief Apply command line flags on top of a configuration
 *
 * Recognized flags: --config, --dataset, --host, --port, --threads,
 * --log-level, --help/-h. --config is only recorded; the caller loads
 * the file before applying the remaining flags again.
 *
 * @throws InvalidConfigError on an unknown flag or a missing/invalid value
 */
auto applyCommandLine(ServerConfig& config, int argc, const char* const* argv)
    -> CommandLine;

/**
 * @brief Usage text for --help
 */
[[nodiscard]] auto usage(std::string_view program) -> std::string;

}  // namespace geoplace::config

#endif  // GEOPLACE_CONFIG_SERVER_CONFIG_HPP

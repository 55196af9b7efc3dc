/*
 * logging_manager.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-28

Description: Process-wide spdlog setup

**************************************************/

#ifndef GEOPLACE_LOGGING_LOGGING_MANAGER_HPP
#define GEOPLACE_LOGGING_LOGGING_MANAGER_HPP

#include <mutex>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "types.hpp"

namespace geoplace::logging {

/**
 * @brief Installs the default spdlog logger from a LoggingConfig
 *
 * All code logs through the spdlog free functions; this class only wires
 * the sinks behind the default logger once at startup and flushes them on
 * shutdown.
 */
class LoggingManager {
public:
    static auto getInstance() -> LoggingManager&;

    LoggingManager(const LoggingManager&) = delete;
    LoggingManager& operator=(const LoggingManager&) = delete;

    /**
     * @brief Create the configured sinks and install the default logger
     *
     * Re-initializing replaces the previous default logger.
     */
    void initialize(const LoggingConfig& config);

    /**
     * @brief Flush and drop all loggers
     */
    void shutdown();

    [[nodiscard]] auto isInitialized() const -> bool;

    /**
     * @brief Names of the sinks that were created successfully
     */
    [[nodiscard]] auto sinkNames() const -> std::vector<std::string>;

private:
    LoggingManager() = default;
    ~LoggingManager() = default;

    mutable std::mutex mutex_;
    bool initialized_{false};
    std::vector<std::string> sinkNames_;
};

/// Logger name used for the process default logger
inline constexpr const char* kDefaultLoggerName = "geoplace";

}  // namespace geoplace::logging

#endif  // GEOPLACE_LOGGING_LOGGING_MANAGER_HPP

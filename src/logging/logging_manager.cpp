/*
 * logging_manager.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "logging_manager.hpp"

#include <utility>

#include "sinks/sink_factory.hpp"

namespace geoplace::logging {

auto LoggingManager::getInstance() -> LoggingManager& {
    static LoggingManager instance;
    return instance;
}

void LoggingManager::initialize(const LoggingConfig& config) {
    std::lock_guard lock(mutex_);

    if (initialized_) {
        spdlog::warn("LoggingManager already initialized, reinitializing...");
        spdlog::drop_all();
    }

    std::vector<spdlog::sink_ptr> sinks;
    std::vector<std::pair<spdlog::sink_ptr, std::string>> customPatterns;
    sinkNames_.clear();
    for (const auto& sinkConfig : config.effectiveSinks()) {
        auto sink = SinkFactory::createSink(sinkConfig);
        if (sink) {
            if (!sinkConfig.pattern.empty()) {
                customPatterns.emplace_back(sink, sinkConfig.pattern);
            }
            sinks.push_back(std::move(sink));
            sinkNames_.push_back(sinkConfig.name);
        }
    }

    auto logger = std::make_shared<spdlog::logger>(
        kDefaultLoggerName, sinks.begin(), sinks.end());
    logger->set_level(config.default_level);
    // set_pattern on the logger resets every sink's formatter
    logger->set_pattern(config.default_pattern);
    for (const auto& [sink, pattern] : customPatterns) {
        sink->set_pattern(pattern);
    }
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);

    initialized_ = true;
    spdlog::info("LoggingManager initialized with {} sinks", sinks.size());
}

void LoggingManager::shutdown() {
    std::lock_guard lock(mutex_);

    if (!initialized_) {
        return;
    }

    spdlog::info("LoggingManager shutting down...");
    spdlog::default_logger()->flush();
    spdlog::drop_all();

    // drop_all() also releases the default logger; keep a console one
    // so late messages still have somewhere to go.
    spdlog::set_default_logger(std::make_shared<spdlog::logger>(
        kDefaultLoggerName, SinkFactory::createConsoleSink()));
    sinkNames_.clear();
    initialized_ = false;
}

auto LoggingManager::isInitialized() const -> bool {
    std::lock_guard lock(mutex_);
    return initialized_;
}

auto LoggingManager::sinkNames() const -> std::vector<std::string> {
    std::lock_guard lock(mutex_);
    return sinkNames_;
}

}  // namespace geoplace::logging

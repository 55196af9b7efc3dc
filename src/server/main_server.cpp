#include "main_server.hpp"

#include <cstdint>

#include <spdlog/fmt/ranges.h>
#include <spdlog/spdlog.h>

#include "controller/place_controller.hpp"
#include "logging/logging.hpp"
#include "place/place.hpp"

namespace geoplace::server {

MainServer::MainServer(const Config& config) : config_(config), app_() {
    initializeLogging();
    spdlog::info("Initializing Geoplace Server v1.0.0");
    initializeIndex();
    initializeMiddleware();
    initializeControllers();
}

void MainServer::start() {
    spdlog::info("Starting server on {}:{} with {} threads", config_.host,
                 config_.port, config_.threadCount);
    app_.bindaddr(config_.host)
        .port(static_cast<std::uint16_t>(config_.port))
        .concurrency(static_cast<std::uint16_t>(config_.threadCount))
        .run();
}

void MainServer::shutdown() {
    spdlog::info("Server stopped");
    auto& manager = logging::LoggingManager::getInstance();
    if (manager.isInitialized()) {
        manager.shutdown();
    }
}

void MainServer::initializeLogging() {
    auto& manager = logging::LoggingManager::getInstance();
    manager.initialize(config_.logging);
    spdlog::debug("Logging to sinks: {}",
                  fmt::join(manager.sinkNames(), ", "));
}

void MainServer::initializeIndex() {
    spdlog::info("Loading dataset from {}", config_.datasetPath);
    auto index = index::Indexer::loadFile(config_.datasetPath);
    const auto& stats = index->stats();
    spdlog::info(
        "Index ready: {} places, {} names, {} skipped, {} duplicate ids in "
        "{}ms",
        stats.retained, stats.distinctNames, stats.skippedByClass,
        stats.duplicateIds, stats.buildTime.count());
    service::loadTimezoneDatabase();
    service_ = std::make_shared<const service::QueryService>(std::move(index));
}

void MainServer::initializeMiddleware() {
    app_.get_middleware<middleware::CORS>().enabled = config_.enableCors;
    spdlog::info("CORS {}", config_.enableCors ? "enabled" : "disabled");
}

void MainServer::initializeControllers() {
    controllers_.push_back(
        std::make_unique<controller::PlaceController>(service_));

    for (auto& controller : controllers_) {
        controller->registerRoutes(app_);
        spdlog::debug("Registered routes of controller '{}'",
                      controller->name());
    }
    spdlog::info("Registered {} controllers", controllers_.size());
}

}  // namespace geoplace::server

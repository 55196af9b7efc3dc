/**
 * @file main.cpp
 * @brief Main entry point for the Geoplace server
 *
 * Loads a GeoNames dump into memory and serves place lookups, listings,
 * name autocomplete and two-place comparisons over HTTP.
 */

#include "config/server_config.hpp"
#include "main_server.hpp"

#include <iostream>

#include <spdlog/spdlog.h>

int main(int argc, char* argv[]) {
    try {
        geoplace::config::ServerConfig config;

        // First pass finds --config; the file is loaded and the command
        // line applied again so flags win over file values.
        auto cli = geoplace::config::applyCommandLine(config, argc, argv);
        if (cli.showHelp) {
            std::cout << geoplace::config::usage(argv[0]);
            return 0;
        }
        if (!cli.configPath.empty()) {
            config = geoplace::config::ServerConfig::loadFromFile(cli.configPath);
            geoplace::config::applyCommandLine(config, argc, argv);
        }
        config.validate();

        geoplace::server::MainServer server(config);

        spdlog::info("==============================================");
        spdlog::info("  Geoplace - GeoNames place lookup service    ");
        spdlog::info("  Version: 1.0.0                              ");
        spdlog::info("==============================================");
        spdlog::info("  Dataset: {}", config.datasetPath);
        spdlog::info("  Listening on http://{}:{}", config.host, config.port);
        spdlog::info("Press Ctrl+C to stop the server");

        // Blocks until Crow handles SIGINT or SIGTERM
        server.start();
        server.shutdown();

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }

    spdlog::info("Server shutdown complete");
    return 0;
}

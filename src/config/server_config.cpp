/*
 * server_config.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "server_config.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "exception/exception.hpp"

namespace geoplace::config {

json ServerConfig::serialize() const {
    return {{"host", host},
            {"port", port},
            {"threadCount", threadCount},
            {"datasetPath", datasetPath},
            {"enableCors", enableCors},
            {"logging", logging.toJson()}};
}

ServerConfig ServerConfig::deserialize(const json& j) {
    ServerConfig cfg;
    try {
        cfg.host = j.value("host", cfg.host);
        cfg.port = j.value("port", cfg.port);
        cfg.threadCount = j.value("threadCount", cfg.threadCount);
        cfg.datasetPath = j.value("datasetPath", cfg.datasetPath);
        cfg.enableCors = j.value("enableCors", cfg.enableCors);
        if (j.contains("logging")) {
            cfg.logging = logging::LoggingConfig::fromJson(j["logging"]);
        }
    } catch (const json::exception& e) {
        THROW_INVALID_CONFIG("Invalid value in ", PATH, ": ", e.what());
    }
    return cfg;
}

ServerConfig ServerConfig::loadFromFile(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        THROW_INVALID_CONFIG("Configuration file not found: ", path);
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        THROW_INVALID_CONFIG("Failed to open configuration file: ", path);
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        THROW_INVALID_CONFIG("Failed to parse configuration file ", path,
                             ": ", e.what());
    }

    if (!j.is_object()) {
        THROW_INVALID_CONFIG("Configuration file ", path,
                             " must contain a JSON object");
    }

    spdlog::info("Loaded configuration from {}", path);
    return deserialize(j);
}

void ServerConfig::validate() const {
    if (port < 1 || port > 65535) {
        THROW_INVALID_CONFIG("port must be in [1, 65535], got ", port);
    }
    if (threadCount < 1) {
        THROW_INVALID_CONFIG("threadCount must be >= 1, got ", threadCount);
    }
    if (datasetPath.empty()) {
        THROW_INVALID_CONFIG("datasetPath must not be empty");
    }
    if (host.empty()) {
        THROW_INVALID_CONFIG("host must not be empty");
    }
}

namespace {

auto parseIntFlag(const std::string& flag, const std::string& value) -> int {
    try {
        size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        if (consumed != value.size()) {
            THROW_INVALID_CONFIG("Invalid value for ", flag, ": ", value);
        }
        return parsed;
    } catch (const std::logic_error&) {
        THROW_INVALID_CONFIG("Invalid value for ", flag, ": ", value);
    }
}

}  // namespace

auto applyCommandLine(ServerConfig& config, int argc, const char* const* argv)
    -> CommandLine {
    CommandLine result;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            result.showHelp = true;
            continue;
        }

        if (i + 1 >= argc) {
            THROW_INVALID_CONFIG("Missing value for ", arg);
        }
        std::string value = argv[++i];

        if (arg == "--config") {
            result.configPath = value;
            continue;
        }
        if (arg == "--dataset") {
            config.datasetPath = value;
        } else if (arg == "--host") {
            config.host = value;
        } else if (arg == "--port") {
            config.port = parseIntFlag(arg, value);
        } else if (arg == "--threads") {
            config.threadCount = parseIntFlag(arg, value);
        } else if (arg == "--log-level") {
            config.logging.default_level = logging::levelFromString(value);
        } else {
            THROW_INVALID_CONFIG("Unknown option: ", arg);
        }
        result.overrides.push_back(arg);
    }
    return result;
}

auto usage(std::string_view program) -> std::string {
    std::ostringstream out;
    out << "Usage: " << program << " [options]\n"
        << "Options:\n"
        << "  --config <path>     JSON configuration file\n"
        << "  --dataset <path>    GeoNames dump to load (default: RU.txt)\n"
        << "  --host <address>    Bind address (default: 127.0.0.1)\n"
        << "  --port <number>     Server port (default: 8000)\n"
        << "  --threads <number>  Worker threads (default: 4)\n"
        << "  --log-level <lvl>   trace|debug|info|warn|error (default: info)\n"
        << "  --help, -h          Show this help message\n";
    return out.str();
}

}  // namespace geoplace::config

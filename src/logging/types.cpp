/*
 * types.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "types.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace geoplace::logging {

auto levelFromString(const std::string& level) -> spdlog::level::level_enum {
    std::string lower = level;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "trace") return spdlog::level::trace;
    if (lower == "debug") return spdlog::level::debug;
    if (lower == "info") return spdlog::level::info;
    if (lower == "warn" || lower == "warning") return spdlog::level::warn;
    if (lower == "error" || lower == "err") return spdlog::level::err;
    if (lower == "critical") return spdlog::level::critical;
    if (lower == "off") return spdlog::level::off;
    return spdlog::level::info;
}

auto levelToString(spdlog::level::level_enum level) -> std::string {
    switch (level) {
        case spdlog::level::trace:
            return "trace";
        case spdlog::level::debug:
            return "debug";
        case spdlog::level::info:
            return "info";
        case spdlog::level::warn:
            return "warn";
        case spdlog::level::err:
            return "error";
        case spdlog::level::critical:
            return "critical";
        case spdlog::level::off:
            return "off";
        default:
            return "unknown";
    }
}

// ============================================================================
// SinkConfig Implementation
// ============================================================================

auto SinkConfig::toJson() const -> nlohmann::json {
    return {{"name", name},
            {"type", type},
            {"level", levelToString(level)},
            {"pattern", pattern},
            {"file_path", file_path},
            {"max_file_size", max_file_size},
            {"max_files", max_files}};
}

auto SinkConfig::fromJson(const nlohmann::json& j) -> SinkConfig {
    SinkConfig config;
    config.name = j.value("name", "");
    config.type = j.value("type", "console");
    config.level = levelFromString(j.value("level", "trace"));
    config.pattern = j.value("pattern", "");
    config.file_path = j.value("file_path", "");
    config.max_file_size =
        j.value("max_file_size", static_cast<size_t>(10 * 1024 * 1024));
    config.max_files = j.value("max_files", static_cast<size_t>(5));
    return config;
}

// ============================================================================
// LoggingConfig Implementation
// ============================================================================

auto LoggingConfig::toJson() const -> nlohmann::json {
    nlohmann::json sinkArray = nlohmann::json::array();
    for (const auto& sink : sinks) {
        sinkArray.push_back(sink.toJson());
    }
    return {{"level", levelToString(default_level)},
            {"pattern", default_pattern},
            {"sinks", sinkArray},
            {"enable_console", enable_console},
            {"enable_file", enable_file},
            {"log_dir", log_dir},
            {"log_filename", log_filename}};
}

auto LoggingConfig::fromJson(const nlohmann::json& j) -> LoggingConfig {
    LoggingConfig config;
    config.default_level =
        levelFromString(j.value("level", levelToString(config.default_level)));
    config.default_pattern = j.value("pattern", config.default_pattern);
    config.enable_console = j.value("enable_console", config.enable_console);
    config.enable_file = j.value("enable_file", config.enable_file);
    config.log_dir = j.value("log_dir", config.log_dir);
    config.log_filename = j.value("log_filename", config.log_filename);

    if (j.contains("sinks") && j["sinks"].is_array()) {
        for (const auto& sink : j["sinks"]) {
            config.sinks.push_back(SinkConfig::fromJson(sink));
        }
    }
    return config;
}

auto LoggingConfig::effectiveSinks() const -> std::vector<SinkConfig> {
    if (!sinks.empty()) {
        return sinks;
    }

    std::vector<SinkConfig> defaults;
    if (enable_console) {
        SinkConfig console;
        console.name = "console";
        console.type = "console";
        console.level = default_level;
        defaults.push_back(console);
    }
    if (enable_file) {
        SinkConfig file;
        file.name = "file";
        file.type = "rotating_file";
        file.level = spdlog::level::debug;
        file.file_path =
            (std::filesystem::path(log_dir) / (log_filename + ".log"))
                .string();
        defaults.push_back(file);
    }
    return defaults;
}

}  // namespace geoplace::logging

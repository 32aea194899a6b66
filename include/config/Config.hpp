#pragma once

#include "config/paths.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>

namespace folio::config {

constexpr static unsigned int DEFAULT_REBUILD_WORKERS = 8;
constexpr static auto DEFAULT_DEBOUNCE_INTERVAL = std::chrono::milliseconds(2000);

struct StoreConfig {
    std::filesystem::path base_path = paths::getDefaultBasePath();
};

struct IndexConfig {
    unsigned int rebuild_workers = DEFAULT_REBUILD_WORKERS;
};

struct WatchConfig {
    bool enabled = true;
    std::chrono::milliseconds debounce_interval = DEFAULT_DEBOUNCE_INTERVAL;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum folio = spdlog::level::info;   // Startup/shutdown, rebuild summaries
    spdlog::level::level_enum store = spdlog::level::warn;   // Unreadable or malformed sidecars
    spdlog::level::level_enum index = spdlog::level::warn;   // Resolution failures, rejected moves
    spdlog::level::level_enum watch = spdlog::level::info;   // Subscription state, flush results
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::warn;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir{}; // empty -> console only
    LogLevelsConfig levels;
};

struct Config {
    StoreConfig store;
    IndexConfig index;
    WatchConfig watch;
    LoggingConfig logging;
};

Config loadConfig(const std::filesystem::path& path);

std::string toYaml(const Config& config);

} // namespace folio::config

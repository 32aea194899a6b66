#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

#include <algorithm>

namespace YAML {

using namespace folio::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<StoreConfig> {
    static Node encode(const StoreConfig& rhs) {
        Node node;
        node["base_path"] = rhs.base_path.string();
        return node;
    }

    static bool decode(const Node& node, StoreConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.base_path = node["base_path"].as<std::string>(folio::paths::getDefaultBasePath().string());
        return true;
    }
};

template<>
struct convert<IndexConfig> {
    static Node encode(const IndexConfig& rhs) {
        Node node;
        node["rebuild_workers"] = rhs.rebuild_workers;
        return node;
    }

    static bool decode(const Node& node, IndexConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.rebuild_workers = std::max(1u, node["rebuild_workers"].as<unsigned int>(DEFAULT_REBUILD_WORKERS));
        return true;
    }
};

template<>
struct convert<WatchConfig> {
    static Node encode(const WatchConfig& rhs) {
        Node node;
        node["enabled"] = rhs.enabled;
        node["debounce_interval_ms"] = static_cast<long>(rhs.debounce_interval.count());
        return node;
    }

    static bool decode(const Node& node, WatchConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.enabled = node["enabled"].as<bool>(true);
        rhs.debounce_interval = std::chrono::milliseconds(
            node["debounce_interval_ms"].as<long>(DEFAULT_DEBOUNCE_INTERVAL.count()));
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["folio"] = to_std_string(spdlog::level::to_string_view(rhs.folio));
        node["store"] = to_std_string(spdlog::level::to_string_view(rhs.store));
        node["index"] = to_std_string(spdlog::level::to_string_view(rhs.index));
        node["watch"] = to_std_string(spdlog::level::to_string_view(rhs.watch));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.folio = spdlog::level::from_str(node["folio"].as<std::string>("info"));
        rhs.store = spdlog::level::from_str(node["store"].as<std::string>("warn"));
        rhs.index = spdlog::level::from_str(node["index"].as<std::string>("warn"));
        rhs.watch = spdlog::level::from_str(node["watch"].as<std::string>("info"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("warn"));
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("");
        if (node["levels"]) rhs.levels = node["levels"].as<LogLevelsConfig>();
        return true;
    }
};

}

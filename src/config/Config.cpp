#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <yaml-cpp/yaml.h>

namespace folio::config {

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;
    const YAML::Node root = YAML::LoadFile(path.string());

    if (const auto node = root["store"]) YAML::convert<StoreConfig>::decode(node, cfg.store);
    if (const auto node = root["index"]) YAML::convert<IndexConfig>::decode(node, cfg.index);
    if (const auto node = root["watch"]) YAML::convert<WatchConfig>::decode(node, cfg.watch);
    if (const auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

    return cfg;
}

std::string toYaml(const Config& config) {
    YAML::Node root;
    root["store"] = config.store;
    root["index"] = config.index;
    root["watch"] = config.watch;
    root["logging"] = config.logging;

    YAML::Emitter out;
    out << root;
    return {out.c_str()};
}

} // namespace folio::config

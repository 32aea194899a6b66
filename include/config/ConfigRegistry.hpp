#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <mutex>

namespace folio::config {

class ConfigRegistry {
public:
    // Loads the YAML file at path, or keeps the built-in defaults if it does not exist.
    static void init(const std::filesystem::path& path = paths::getConfigPath());
    static void init(const Config& config);
    static const Config& get();

    [[nodiscard]] static bool usingDefaults() { return usingDefaults_; }

private:
    static void ensureInitialized();

    static inline Config config_;
    static inline bool initialized_ = false;
    static inline bool usingDefaults_ = false;
    static inline std::mutex mutex_;
};

} // namespace folio::config

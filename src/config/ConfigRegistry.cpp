#include "config/ConfigRegistry.hpp"

#include <stdexcept>

namespace folio::config {

void ConfigRegistry::init(const std::filesystem::path& path) {
    std::scoped_lock lock(mutex_);
    if (std::filesystem::exists(path)) {
        config_ = loadConfig(path);
        usingDefaults_ = false;
    } else {
        config_ = Config{};
        usingDefaults_ = true;
    }
    initialized_ = true;
}

void ConfigRegistry::init(const Config& config) {
    std::scoped_lock lock(mutex_);
    config_ = config;
    usingDefaults_ = false;
    initialized_ = true;
}

const Config& ConfigRegistry::get() {
    ensureInitialized();
    return config_;
}

void ConfigRegistry::ensureInitialized() {
    if (!initialized_)
        throw std::runtime_error("ConfigRegistry accessed before initialization. Call ConfigRegistry::init() first.");
}

} // namespace folio::config

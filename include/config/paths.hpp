#pragma once

#include <cstdlib>
#include <filesystem>

namespace folio::paths {

inline std::filesystem::path getConfigPath() {
    if (const char* env = std::getenv("FOLIO_CONFIG")) return env;
    return "/etc/folio/config.yaml";
}

// The tablet keeps its document store under xochitl's data directory; anywhere
// else we fall back to the bundled samples used during development.
inline std::filesystem::path getDefaultBasePath() {
#if defined(__arm__) && defined(__linux__)
    return "/home/root/.local/share/remarkable/xochitl/";
#else
    return "./samples/v6/";
#endif
}

}

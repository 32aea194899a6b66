// Index
#include "fs/Filesystem.hpp"
#include "fs/cache/Registry.hpp"
#include "storage/SidecarStore.hpp"

// Watch
#include "sync/WatchSession.hpp"

// Misc
#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"

// Libraries
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <thread>
#include <fmt/core.h>

using namespace folio;
using namespace folio::config;

namespace {
std::atomic shouldExit = false;

void signalHandler(const int) { shouldExit = true; }
}

int main(const int argc, char** argv) {
    try {
        ConfigRegistry::init(argc > 1 ? std::filesystem::path(argv[1]) : paths::getConfigPath());
        log::Registry::init();

        const auto& cnf = ConfigRegistry::get();
        if (ConfigRegistry::usingDefaults())
            log::Registry::folio()->warn("[*] No config file found, using built-in defaults.");

        log::Registry::folio()->info("[*] Initializing Folio for {}", cnf.store.base_path.string());

        auto store = std::make_shared<storage::SidecarStore>(cnf.store.base_path);
        auto filesystem = std::make_shared<fs::Filesystem>(store, cnf.index.rebuild_workers);
        filesystem->rebuild();

        log::Registry::folio()->info("[✓] Index ready with {} items.", filesystem->registry()->size());

        std::unique_ptr<sync::WatchSession> session;
        if (cnf.watch.enabled) {
            session = std::make_unique<sync::WatchSession>(filesystem, cnf.watch.debounce_interval);
            session->start();
            log::Registry::folio()->info("[*] Watch session {}.", sync::to_string(session->state()));
        }

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        while (!shouldExit) std::this_thread::sleep_for(std::chrono::milliseconds(200));

        log::Registry::folio()->info("[!] Shutdown requested, stopping Folio...");

        if (session) session->stop();
        session.reset();
        filesystem.reset();

        log::Registry::folio()->info("[✓] Folio shut down cleanly.");
        log::Registry::shutdown();

        return EXIT_SUCCESS;
    } catch (const std::exception& e) {
        if (log::Registry::isInitialized()) log::Registry::folio()->error("[-] Failed to start Folio: {}", e.what());
        else fmt::print(stderr, "[-] Failed to start Folio: {}\n", e.what());
        return EXIT_FAILURE;
    }
}

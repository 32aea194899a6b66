#pragma once

#include "concurrency/AsyncService.hpp"
#include "sync/ChangeSet.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace folio::fs {
class Filesystem;
}

namespace folio::sync {

class Notifier;

// Keeps the index in step with the store. The notifier thread only classifies
// events into the inbox; the session loop drains it once per interval, drops
// deleted identifiers and re-reads updated ones. New directories are walked
// and an overflowed event queue triggers a full rebuild, both on the loop.
class WatchSession final : public concurrency::AsyncService {
public:
    enum class State { Idle, Watching, Stopped, Failed };

    struct FlushReport {
        std::size_t removed = 0;
        std::size_t updated = 0;
        std::size_t failed = 0;
        std::size_t directories = 0;
        bool rebuilt = false;
    };

    static constexpr std::chrono::milliseconds DEFAULT_INTERVAL{2000};

    explicit WatchSession(std::shared_ptr<fs::Filesystem> filesystem,
                          std::chrono::milliseconds interval = DEFAULT_INTERVAL);

    ~WatchSession() override;

    // A watch that cannot be set up leaves the session Failed; nothing is thrown.
    void start() override;
    void stop() override;

    void enqueue(const Change& change);
    void onEvent(EventKind kind, const std::filesystem::path& path);

    // Applies everything queued so far. Deletes go first, so an identifier both
    // deleted and updated in one window ends up present when it can be read.
    // A pending overflow replaces the window with a rebuild.
    FlushReport flush();

    [[nodiscard]] State state() const { return state_.load(std::memory_order_acquire); }
    [[nodiscard]] std::size_t pending() const;

protected:
    void runLoop() override;

private:
    static constexpr std::chrono::milliseconds SLEEP_STEP{50};

    std::shared_ptr<fs::Filesystem> fs_;
    std::chrono::milliseconds interval_;
    std::unique_ptr<Notifier> notifier_;

    mutable std::mutex inboxMutex_;
    std::vector<Change> inbox_;
    std::vector<std::filesystem::path> newDirectories_;
    std::atomic<bool> rebuildRequested_{false};

    std::mutex flushMutex_;
    std::atomic<State> state_{State::Idle};
};

std::string to_string(WatchSession::State state);

}

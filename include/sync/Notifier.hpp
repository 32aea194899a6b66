#pragma once

#include "sync/ChangeSet.hpp"

#include <atomic>
#include <filesystem>
#include <functional>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace folio::sync {

// Recursive inotify subscription rooted at one directory. Events are handed to
// the callback on the notifier's own thread. A directory created after start()
// is watched at once and reported as DirectoryCreated; walking its contents is
// left to the consumer through watchTree(). A kernel queue overflow is reported
// as Overflow on the root.
class Notifier {
public:
    using Callback = std::function<void(EventKind, const std::filesystem::path&)>;

    static constexpr int POLL_TIMEOUT_MS = 100;

    Notifier(std::filesystem::path root, Callback callback);
    ~Notifier();

    Notifier(const Notifier&) = delete;
    Notifier& operator=(const Notifier&) = delete;

    // Throws WatchSetupError when inotify is unavailable or the root cannot be watched.
    void start();

    // Returns once the notifier thread has exited.
    void stop();

    [[nodiscard]] bool isRunning() const { return running_.load(std::memory_order_acquire); }

    // Watches every directory below dir and reports each file found as Create.
    void watchTree(const std::filesystem::path& dir);

    [[nodiscard]] std::size_t watchCount() const;

    [[nodiscard]] const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
    Callback callback_;

    int fd_ = -1;
    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stopFlag_{false};

    mutable std::mutex watchesMutex_;
    std::unordered_map<int, std::filesystem::path> watches_;

    bool addWatch(const std::filesystem::path& dir);
    void addRecursive(const std::filesystem::path& dir, bool announceFiles);
    void run();
    void dispatch(const char* buffer, long length);
    void deliver(EventKind kind, const std::filesystem::path& path) const;
    void closeFd();
};

}

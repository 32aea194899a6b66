#include "sync/WatchSession.hpp"
#include "sync/Notifier.hpp"
#include "fs/Filesystem.hpp"
#include "fs/cache/Registry.hpp"
#include "fs/Errors.hpp"
#include "storage/RecordStore.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <thread>

using namespace folio::sync;
using namespace std::chrono;

WatchSession::WatchSession(std::shared_ptr<fs::Filesystem> filesystem, const milliseconds interval)
    : AsyncService("WatchSession"), fs_(std::move(filesystem)), interval_(interval) {
    if (!fs_) throw std::invalid_argument("WatchSession requires a filesystem");
    if (interval_ <= milliseconds::zero()) throw std::invalid_argument("Debounce interval must be positive");
}

WatchSession::~WatchSession() { stop(); }

void WatchSession::start() {
    if (isRunning()) return;

    {
        std::lock_guard flushLock(flushMutex_);
        try {
            notifier_ = std::make_unique<Notifier>(fs_->store()->basePath(),
                [this](const EventKind kind, const std::filesystem::path& path) { onEvent(kind, path); });
            notifier_->start();
        } catch (const fs::WatchSetupError& e) {
            log::Registry::watch()->error("[WatchSession] Watch setup failed, serving the last index: {}", e.what());
            notifier_.reset();
            state_.store(State::Failed, std::memory_order_release);
            return;
        }
    }

    AsyncService::start();
    state_.store(State::Watching, std::memory_order_release);
}

void WatchSession::stop() {
    AsyncService::stop();

    {
        std::lock_guard flushLock(flushMutex_);
        if (notifier_) {
            notifier_->stop();
            notifier_.reset();
        }
    }

    auto expected = State::Watching;
    state_.compare_exchange_strong(expected, State::Stopped, std::memory_order_acq_rel);
}

void WatchSession::enqueue(const Change& change) {
    std::lock_guard lock(inboxMutex_);
    inbox_.push_back(change);
}

void WatchSession::onEvent(const EventKind kind, const std::filesystem::path& path) {
    switch (kind) {
        case EventKind::Overflow:
            if (!rebuildRequested_.exchange(true, std::memory_order_acq_rel))
                log::Registry::watch()->warn("[WatchSession] Events were dropped, rebuilding on the next flush");
            return;
        case EventKind::DirectoryCreated: {
            std::lock_guard lock(inboxMutex_);
            newDirectories_.push_back(path);
            return;
        }
        default:
            if (const auto change = classify(kind, path)) enqueue(*change);
    }
}

std::size_t WatchSession::pending() const {
    std::lock_guard lock(inboxMutex_);
    return inbox_.size();
}

WatchSession::FlushReport WatchSession::flush() {
    std::lock_guard flushLock(flushMutex_);

    std::vector<Change> drained;
    std::vector<std::filesystem::path> directories;
    {
        std::lock_guard lock(inboxMutex_);
        drained.swap(inbox_);
        directories.swap(newDirectories_);
    }

    FlushReport report;

    // Walking a new directory announces files that landed before its watch,
    // so it runs ahead of the rebuild check and feeds the next window.
    if (notifier_)
        for (const auto& dir : directories) {
            notifier_->watchTree(dir);
            ++report.directories;
        }

    if (rebuildRequested_.exchange(false, std::memory_order_acq_rel)) {
        fs_->rebuild();
        report.rebuilt = true;
        log::Registry::watch()->info("[WatchSession] Rebuilt the index after dropped events ({} queued events superseded)",
                                     drained.size());
        return report;
    }

    if (drained.empty()) return report;

    ChangeSet changes;
    changes.add(drained);

    for (const auto& id : changes.toDelete)
        if (fs_->evict(id)) ++report.removed;

    const std::vector<fs::model::Identifier> ids(changes.toUpdate.begin(), changes.toUpdate.end());
    for (const auto& item : fs_->readAll(ids)) {
        fs_->registry()->upsert(item);
        ++report.updated;
    }
    report.failed = ids.size() - report.updated;

    changes.clear();

    log::Registry::watch()->debug("[WatchSession] Flushed {} events: {} removed, {} updated, {} failed",
                                  drained.size(), report.removed, report.updated, report.failed);
    return report;
}

void WatchSession::runLoop() {
    while (!interruptFlag_.load(std::memory_order_acquire)) {
        const auto deadline = steady_clock::now() + interval_;
        while (!interruptFlag_.load(std::memory_order_acquire) && steady_clock::now() < deadline)
            std::this_thread::sleep_for(std::min<milliseconds>(SLEEP_STEP, duration_cast<milliseconds>(deadline - steady_clock::now())));

        if (interruptFlag_.load(std::memory_order_acquire)) break;

        try {
            flush();
        } catch (const std::exception& e) {
            log::Registry::watch()->error("[WatchSession] Flush failed: {}", e.what());
        }
    }
}

std::string folio::sync::to_string(const WatchSession::State state) {
    switch (state) {
        case WatchSession::State::Idle: return "idle";
        case WatchSession::State::Watching: return "watching";
        case WatchSession::State::Stopped: return "stopped";
        case WatchSession::State::Failed: return "failed";
    }
    return "unknown";
}

#include "sync/Notifier.hpp"
#include "fs/Errors.hpp"
#include "log/Registry.hpp"

#include <cerrno>
#include <climits>
#include <cstring>
#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>

using namespace folio::sync;
using namespace folio::log;

namespace {

constexpr uint32_t WATCH_MASK = IN_CREATE | IN_DELETE | IN_DELETE_SELF | IN_MODIFY | IN_CLOSE_WRITE |
                                IN_ATTRIB | IN_MOVED_FROM | IN_MOVED_TO;

EventKind kindOf(const uint32_t mask) {
    if (mask & (IN_DELETE | IN_DELETE_SELF | IN_MOVED_FROM)) return EventKind::Remove;
    if (mask & (IN_CREATE | IN_MOVED_TO)) return EventKind::Create;
    if (mask & (IN_MODIFY | IN_CLOSE_WRITE | IN_ATTRIB)) return EventKind::Modify;
    return EventKind::Access;
}

}

Notifier::Notifier(std::filesystem::path root, Callback callback)
    : root_(std::move(root)), callback_(std::move(callback)) {
    if (!callback_) throw std::invalid_argument("Notifier requires a callback");
}

Notifier::~Notifier() { stop(); }

void Notifier::start() {
    if (isRunning()) return;
    if (thread_.joinable()) thread_.join(); // previous run ended on its own
    closeFd();

    fd_ = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (fd_ == -1) throw fs::WatchSetupError(std::string("inotify_init1 failed: ") + std::strerror(errno));

    if (!addWatch(root_)) {
        const auto err = errno;
        closeFd();
        throw fs::WatchSetupError("Cannot watch " + root_.string() + ": " + std::strerror(err));
    }

    addRecursive(root_, false);

    stopFlag_.store(false, std::memory_order_release);
    running_.store(true, std::memory_order_release);
    thread_ = std::thread(&Notifier::run, this);

    Registry::watch()->info("[Notifier] Watching {} ({} directories)", root_.string(), watchCount());
}

void Notifier::stop() {
    stopFlag_.store(true, std::memory_order_release);
    if (thread_.joinable()) thread_.join();
    closeFd();

    if (running_.exchange(false, std::memory_order_acq_rel))
        Registry::watch()->info("[Notifier] Stopped watching {}", root_.string());
}

std::size_t Notifier::watchCount() const {
    std::lock_guard lock(watchesMutex_);
    return watches_.size();
}

void Notifier::watchTree(const std::filesystem::path& dir) {
    if (!isRunning()) return;
    addRecursive(dir, true);
}

bool Notifier::addWatch(const std::filesystem::path& dir) {
    const int wd = inotify_add_watch(fd_, dir.c_str(), WATCH_MASK);
    if (wd == -1) return false;

    std::lock_guard lock(watchesMutex_);
    watches_[wd] = dir;
    return true;
}

void Notifier::addRecursive(const std::filesystem::path& dir, const bool announceFiles) {
    std::error_code ec;
    auto it = std::filesystem::recursive_directory_iterator(
        dir, std::filesystem::directory_options::skip_permission_denied, ec);
    if (ec) {
        Registry::watch()->warn("[Notifier] Cannot walk {}: {}", dir.string(), ec.message());
        return;
    }

    for (; it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            Registry::watch()->warn("[Notifier] Error walking {}: {}", dir.string(), ec.message());
            break;
        }

        if (it->is_directory(ec)) {
            if (!addWatch(it->path()))
                Registry::watch()->warn("[Notifier] Cannot watch {}: {}", it->path().string(), std::strerror(errno));
        } else if (announceFiles) {
            // Files that landed before the new directory's watch existed.
            deliver(EventKind::Create, it->path());
        }
    }
}

void Notifier::run() {
    alignas(inotify_event) char buffer[16 * (sizeof(inotify_event) + NAME_MAX + 1)];

    while (!stopFlag_.load(std::memory_order_acquire)) {
        pollfd pfd{fd_, POLLIN, 0};
        const int ready = ::poll(&pfd, 1, POLL_TIMEOUT_MS);

        if (ready < 0) {
            if (errno == EINTR) continue;
            Registry::watch()->error("[Notifier] poll failed: {}", std::strerror(errno));
            break;
        }
        if (ready == 0) continue;

        const auto length = ::read(fd_, buffer, sizeof(buffer));
        if (length < 0) {
            if (errno == EAGAIN || errno == EINTR) continue;
            Registry::watch()->error("[Notifier] read failed: {}", std::strerror(errno));
            break;
        }

        dispatch(buffer, length);
    }

    running_.store(false, std::memory_order_release);
}

void Notifier::dispatch(const char* buffer, const long length) {
    for (const char* ptr = buffer; ptr < buffer + length;) {
        const auto* event = reinterpret_cast<const inotify_event*>(ptr);
        ptr += sizeof(inotify_event) + event->len;

        if (event->mask & IN_Q_OVERFLOW) {
            Registry::watch()->warn("[Notifier] Event queue overflowed, changes may have been missed");
            deliver(EventKind::Overflow, root_);
            continue;
        }

        std::filesystem::path dir;
        {
            std::lock_guard lock(watchesMutex_);
            const auto it = watches_.find(event->wd);
            if (it == watches_.end()) continue;
            dir = it->second;
            if (event->mask & IN_IGNORED) {
                watches_.erase(it);
                continue;
            }
        }

        const auto path = event->len > 0 ? dir / event->name : dir;

        if ((event->mask & IN_ISDIR) && (event->mask & (IN_CREATE | IN_MOVED_TO))) {
            if (!addWatch(path))
                Registry::watch()->warn("[Notifier] Cannot watch new directory {}: {}", path.string(), std::strerror(errno));
            deliver(EventKind::DirectoryCreated, path);
            continue;
        }

        deliver(kindOf(event->mask), path);
    }
}

void Notifier::deliver(const EventKind kind, const std::filesystem::path& path) const {
    try {
        callback_(kind, path);
    } catch (const std::exception& e) {
        Registry::watch()->error("[Notifier] Callback failed for {}: {}", path.string(), e.what());
    }
}

void Notifier::closeFd() {
    if (fd_ != -1) {
        ::close(fd_);
        fd_ = -1;
    }
    std::lock_guard lock(watchesMutex_);
    watches_.clear();
}

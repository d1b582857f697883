/**
 * @file change_watcher.cpp
 * @brief inotify-backed change watcher
 * @author SimpleDaemons
 * @copyright 2024 SimpleDaemons
 * @license Apache-2.0
 */

#include "simple_vfsd/change_watcher.hpp"
#include "simple_vfsd/logger.hpp"
#include <cerrno>
#include <cstring>
#include <system_error>
#include <utility>
#include <vector>
#include <unistd.h>
#ifdef __linux__
#include <sys/inotify.h>
#include <sys/select.h>
#endif

namespace SimpleVfsd {

#ifdef __linux__
namespace {
constexpr uint32_t WATCH_MASK = IN_MODIFY | IN_CREATE | IN_DELETE | IN_MOVE | IN_CLOSE_WRITE;
}
#endif

ChangeWatcher::ChangeWatcher(Vfs& vfs, std::mutex& vfs_mutex, int poll_interval_ms)
    : vfs_(vfs)
    , vfs_mutex_(vfs_mutex)
    , poll_interval_ms_(poll_interval_ms > 0 ? poll_interval_ms : 500)
    , inotify_fd_(-1)
    , running_(false)
    , stop_requested_(false)
    , event_count_(0) {
}

ChangeWatcher::~ChangeWatcher() {
    stop();
}

bool ChangeWatcher::start() {
    if (running_) {
        return true; // Already watching
    }

#ifdef __linux__
    inotify_fd_ = inotify_init1(IN_CLOEXEC);
    if (inotify_fd_ < 0) {
        Logger::error(std::string("Failed to initialize inotify: ") + std::strerror(errno));
        return false;
    }

    std::vector<std::pair<Route, std::filesystem::path>> roots;
    {
        std::lock_guard<std::mutex> lock(vfs_mutex_);
        for (const auto& name : vfs_.partitions().names()) {
            roots.emplace_back(Route{name}, vfs_.partitions().rootOf(name));
        }
    }

    for (const auto& root : roots) {
        addWatchRecursive(root.first, root.second);
    }

    if (getWatchCount() == 0) {
        Logger::warn("No partition could be watched");
    }

    stop_requested_ = false;
    running_ = true;
    watch_thread_ = std::thread(&ChangeWatcher::watchLoop, this);

    Logger::info("Watching " + std::to_string(getWatchCount()) + " directories for changes");
    return true;
#else
    Logger::error("Change watching is only supported on Linux");
    return false;
#endif
}

void ChangeWatcher::stop() {
    if (!running_) {
        return;
    }

    stop_requested_ = true;
    if (watch_thread_.joinable()) {
        watch_thread_.join();
    }

    closeWatches();
    running_ = false;
}

bool ChangeWatcher::isRunning() const {
    return running_;
}

size_t ChangeWatcher::getWatchCount() const {
    std::lock_guard<std::mutex> lock(watches_mutex_);
    return watches_.size();
}

void ChangeWatcher::addWatchRecursive(const Route& route, const std::filesystem::path& path) {
    if (!addWatch(route, path)) {
        return;
    }

    // Only a partition root can be a symlink here; children are filtered below
    std::error_code ec;
    if (!std::filesystem::is_directory(std::filesystem::status(path, ec))) {
        return;
    }

    std::filesystem::directory_iterator it(path, ec);
    if (ec) {
        Logger::warn("Cannot enumerate " + path.string() + ": " + ec.message());
        return;
    }

    for (std::filesystem::directory_iterator end; it != end; it.increment(ec)) {
        if (it->is_directory(ec) && !it->is_symlink(ec)) {
            addWatchRecursive(childRoute(route, it->path().filename().string()), it->path());
        }
    }
}

bool ChangeWatcher::addWatch(const Route& route, const std::filesystem::path& path) {
#ifdef __linux__
    int wd = inotify_add_watch(inotify_fd_, path.c_str(), WATCH_MASK);
    if (wd < 0) {
        Logger::warn("Failed to add watch for " + path.string() + ": " + std::strerror(errno));
        return false;
    }

    std::lock_guard<std::mutex> lock(watches_mutex_);
    watches_[wd] = WatchTarget{route, path};
    Logger::debug("Watching " + routeToString(route) + " at " + path.string());
    return true;
#else
    (void)route;
    (void)path;
    return false;
#endif
}

void ChangeWatcher::removeWatchSubtree(const std::filesystem::path& path) {
    std::lock_guard<std::mutex> lock(watches_mutex_);

    const std::string prefix = path.string() + "/";
    for (auto it = watches_.begin(); it != watches_.end();) {
        const std::string watched = it->second.path.string();
        if (watched == path.string() || watched.compare(0, prefix.size(), prefix) == 0) {
#ifdef __linux__
            inotify_rm_watch(inotify_fd_, it->first);
#endif
            Logger::debug("Dropped watch for " + routeToString(it->second.route));
            it = watches_.erase(it);
        } else {
            ++it;
        }
    }
}

void ChangeWatcher::watchLoop() {
#ifdef __linux__
    alignas(struct inotify_event) char buffer[4096];

    while (!stop_requested_) {
        fd_set read_fds;
        FD_ZERO(&read_fds);
        FD_SET(inotify_fd_, &read_fds);

        struct timeval timeout;
        timeout.tv_sec = poll_interval_ms_ / 1000;
        timeout.tv_usec = (poll_interval_ms_ % 1000) * 1000;

        int result = select(inotify_fd_ + 1, &read_fds, nullptr, nullptr, &timeout);
        if (result < 0) {
            if (errno == EINTR) {
                continue;
            }
            Logger::error(std::string("Watch loop select failed: ") + std::strerror(errno));
            break;
        }

        if (result > 0 && FD_ISSET(inotify_fd_, &read_fds)) {
            ssize_t length = read(inotify_fd_, buffer, sizeof(buffer));
            if (length > 0) {
                processBuffer(buffer, length);
            }
        }
    }
#endif
}

void ChangeWatcher::processBuffer(const char* buffer, ssize_t length) {
#ifdef __linux__
    ssize_t offset = 0;

    while (offset < length) {
        const struct inotify_event* event = reinterpret_cast<const struct inotify_event*>(buffer + offset);
        offset += static_cast<ssize_t>(sizeof(struct inotify_event) + event->len);

        // Overflow events carry wd -1, so they never match a watch
        if (event->mask & IN_Q_OVERFLOW) {
            Logger::warn("inotify queue overflow, some changes were lost");
            continue;
        }

        WatchTarget target;
        {
            std::lock_guard<std::mutex> lock(watches_mutex_);
            auto it = watches_.find(event->wd);
            if (it == watches_.end()) {
                continue;
            }
            target = it->second;

            if (event->mask & IN_IGNORED) {
                watches_.erase(it);
                continue;
            }
        }

        Route route = target.route;
        std::filesystem::path path = target.path;
        if (event->len > 0) {
            std::string name(event->name);
            route = childRoute(route, name);
            path /= name;
        }

        // New directories need their own watches; a directory moved away
        // takes its watches with it and is re-watched under its new route
        if ((event->mask & IN_ISDIR) && (event->mask & IN_MOVED_FROM)) {
            removeWatchSubtree(path);
        }
        if ((event->mask & IN_ISDIR) && (event->mask & (IN_CREATE | IN_MOVED_TO))) {
            addWatchRecursive(route, path);
        }

        recordChange(route);
    }
#else
    (void)buffer;
    (void)length;
#endif
}

void ChangeWatcher::recordChange(const Route& route) {
    event_count_++;

    std::lock_guard<std::mutex> lock(vfs_mutex_);
    vfs_.addChange(vfs_.currentTime(), route);
}

void ChangeWatcher::closeWatches() {
    std::lock_guard<std::mutex> lock(watches_mutex_);

#ifdef __linux__
    for (const auto& pair : watches_) {
        inotify_rm_watch(inotify_fd_, pair.first);
    }
#endif
    watches_.clear();

    if (inotify_fd_ >= 0) {
        close(inotify_fd_);
        inotify_fd_ = -1;
    }
}

} // namespace SimpleVfsd

/**
 * @file change_watcher.hpp
 * @brief Filesystem notification feed into the Vfs change log
 * @author SimpleDaemons
 * @copyright 2024 SimpleDaemons
 * @license Apache-2.0
 */

#ifndef SIMPLE_VFSD_CHANGE_WATCHER_HPP
#define SIMPLE_VFSD_CHANGE_WATCHER_HPP

#include "simple_vfsd/vfs.hpp"
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <sys/types.h>
#include <thread>

namespace SimpleVfsd {

// Watches every partition root of a Vfs (recursively) and reports each
// notification as a raw route through Vfs::addChange. The Vfs is only
// touched while vfs_mutex is held.
class ChangeWatcher {
public:
    ChangeWatcher(Vfs& vfs, std::mutex& vfs_mutex, int poll_interval_ms = 500);
    ~ChangeWatcher();

    ChangeWatcher(const ChangeWatcher&) = delete;
    ChangeWatcher& operator=(const ChangeWatcher&) = delete;

    // Register watches for the partitions known now and start the thread
    bool start();
    void stop();
    bool isRunning() const;

    uint64_t getEventCount() const { return event_count_.load(); }
    size_t getWatchCount() const;

protected:
    // Handle every inotify_event in one read() result
    void processBuffer(const char* buffer, ssize_t length);

private:
    struct WatchTarget {
        Route route;
        std::filesystem::path path;
    };

    Vfs& vfs_;
    std::mutex& vfs_mutex_;
    int poll_interval_ms_;

    int inotify_fd_;
    std::map<int, WatchTarget> watches_;
    mutable std::mutex watches_mutex_;

    std::thread watch_thread_;
    std::atomic<bool> running_;
    std::atomic<bool> stop_requested_;
    std::atomic<uint64_t> event_count_;

    void addWatchRecursive(const Route& route, const std::filesystem::path& path);
    bool addWatch(const Route& route, const std::filesystem::path& path);
    void removeWatchSubtree(const std::filesystem::path& path);
    void watchLoop();
    void recordChange(const Route& route);
    void closeWatches();
};

} // namespace SimpleVfsd

#endif // SIMPLE_VFSD_CHANGE_WATCHER_HPP

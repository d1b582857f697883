/**
 * @file change_log.hpp
 * @brief Monotonic clock and append-only change history
 * @author SimpleDaemons
 * @copyright 2024 SimpleDaemons
 * @license Apache-2.0
 */

#ifndef SIMPLE_VFSD_CHANGE_LOG_HPP
#define SIMPLE_VFSD_CHANGE_LOG_HPP

#include "simple_vfsd/vfs_item.hpp"
#include <chrono>
#include <memory>
#include <vector>

namespace SimpleVfsd {

// Seconds elapsed since construction, from the steady clock
class Clock {
public:
    Clock();

    double now() const;
    std::chrono::steady_clock::time_point origin() const { return origin_; }

private:
    std::chrono::steady_clock::time_point origin_;
};

// Hook invoked after every append. The history is unbounded unless a
// policy is installed; a policy may only remove entries from the front.
class RetentionPolicy {
public:
    virtual ~RetentionPolicy() = default;

    virtual void apply(std::vector<VfsChange>& history) = 0;
};

// Append-only, timestamp-ordered list of changes.
//
// Callers must append with non-decreasing timestamps; changesSince relies
// on it. A decreasing timestamp is logged and appended as given.
class ChangeLog {
public:
    ChangeLog() = default;

    // Append one entry per route, all sharing timestamp, in order
    void append(double timestamp, const std::vector<Route>& routes);

    // Longest suffix whose entries all have timestamp >= since
    std::vector<VfsChange> changesSince(double since) const;

    // Index of the first entry returned by changesSince(since); size() when none
    size_t suffixStart(double since) const;

    const std::vector<VfsChange>& history() const { return history_; }
    size_t size() const { return history_.size(); }
    bool empty() const { return history_.empty(); }

    void setRetentionPolicy(std::unique_ptr<RetentionPolicy> policy);

private:
    std::vector<VfsChange> history_;
    std::unique_ptr<RetentionPolicy> retention_;
};

} // namespace SimpleVfsd

#endif // SIMPLE_VFSD_CHANGE_LOG_HPP

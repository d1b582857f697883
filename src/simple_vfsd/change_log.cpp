/**
 * @file change_log.cpp
 * @brief Change history implementation
 * @author SimpleDaemons
 * @copyright 2024 SimpleDaemons
 * @license Apache-2.0
 */

#include "simple_vfsd/change_log.hpp"
#include "simple_vfsd/logger.hpp"
#include <cstddef>
#include <sstream>

namespace SimpleVfsd {

Clock::Clock() : origin_(std::chrono::steady_clock::now()) {
}

double Clock::now() const {
    auto elapsed = std::chrono::steady_clock::now() - origin_;
    return std::chrono::duration<double>(elapsed).count();
}

void ChangeLog::append(double timestamp, const std::vector<Route>& routes) {
    if (routes.empty()) {
        return;
    }

    if (!history_.empty() && timestamp < history_.back().timestamp) {
        std::ostringstream oss;
        oss << "Change timestamp " << timestamp << " is older than last recorded "
            << history_.back().timestamp << "; changesSince may miss entries";
        Logger::warn(oss.str());
    }

    for (const auto& route : routes) {
        history_.emplace_back(timestamp, route);
    }

    if (retention_) {
        retention_->apply(history_);
    }
}

size_t ChangeLog::suffixStart(double since) const {
    size_t start = history_.size();

    // Walk back from the newest entry until one is older than since
    while (start > 0 && history_[start - 1].timestamp >= since) {
        --start;
    }

    return start;
}

std::vector<VfsChange> ChangeLog::changesSince(double since) const {
    auto first = history_.begin() + static_cast<std::ptrdiff_t>(suffixStart(since));
    return std::vector<VfsChange>(first, history_.end());
}

void ChangeLog::setRetentionPolicy(std::unique_ptr<RetentionPolicy> policy) {
    retention_ = std::move(policy);
}

} // namespace SimpleVfsd

/**
 * @file test_change_log.cpp
 * @brief Unit tests for Clock and ChangeLog
 * @author SimpleDaemons
 * @copyright 2024 SimpleDaemons
 * @license Apache-2.0
 */

#include <gtest/gtest.h>
#include "simple_vfsd/change_log.hpp"
#include <chrono>
#include <cstddef>
#include <memory>
#include <thread>

using SimpleVfsd::ChangeLog;
using SimpleVfsd::Route;
using SimpleVfsd::VfsChange;

namespace {

// Keeps only the newest max_entries changes
class KeepLastPolicy : public SimpleVfsd::RetentionPolicy {
public:
    explicit KeepLastPolicy(size_t max_entries) : max_entries_(max_entries) {}

    void apply(std::vector<VfsChange>& history) override {
        calls++;
        if (history.size() > max_entries_) {
            history.erase(history.begin(), history.end() - static_cast<std::ptrdiff_t>(max_entries_));
        }
    }

    int calls = 0;

private:
    size_t max_entries_;
};

} // namespace

class ChangeLogTest : public ::testing::Test {
protected:
    void SetUp() override {
        change_log.append(1.0, {Route{"site", "a"}});
        change_log.append(2.0, {Route{"site", "b"}, Route{"site", "c"}});
        change_log.append(3.0, {Route{"site", "d"}});
    }

    ChangeLog change_log;
};

TEST(ClockTest, StartsNearZero) {
    SimpleVfsd::Clock clock;
    double now = clock.now();

    EXPECT_GE(now, 0.0);
    EXPECT_LT(now, 5.0);
}

TEST(ClockTest, StrictlyIncreasesOverRealTime) {
    SimpleVfsd::Clock clock;
    double first = clock.now();
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    double second = clock.now();

    EXPECT_GT(second, first);
    EXPECT_GE(second - first, 0.009);
}

TEST_F(ChangeLogTest, AppendSharesTimestampAndKeepsOrder) {
    ASSERT_EQ(change_log.size(), 4u);
    EXPECT_EQ(change_log.history()[1], VfsChange(2.0, Route{"site", "b"}));
    EXPECT_EQ(change_log.history()[2], VfsChange(2.0, Route{"site", "c"}));
}

TEST_F(ChangeLogTest, AppendWithNoRoutesIsNoop) {
    change_log.append(4.0, {});
    EXPECT_EQ(change_log.size(), 4u);
}

TEST_F(ChangeLogTest, ChangesSinceReturnsMaximalSuffix) {
    auto changes = change_log.changesSince(2.0);

    ASSERT_EQ(changes.size(), 3u);
    EXPECT_EQ(changes[0].route, (Route{"site", "b"}));
    EXPECT_EQ(changes[1].route, (Route{"site", "c"}));
    EXPECT_EQ(changes[2].route, (Route{"site", "d"}));
}

TEST_F(ChangeLogTest, ChangesSinceBetweenTimestamps) {
    auto changes = change_log.changesSince(2.5);

    ASSERT_EQ(changes.size(), 1u);
    EXPECT_EQ(changes[0].timestamp, 3.0);
}

TEST_F(ChangeLogTest, ChangesSinceBeforeEverythingReturnsWholeLog) {
    EXPECT_EQ(change_log.changesSince(0.0).size(), 4u);
    EXPECT_EQ(change_log.changesSince(1.0).size(), 4u);
    EXPECT_EQ(change_log.suffixStart(0.0), 0u);
}

TEST_F(ChangeLogTest, ChangesSinceAfterEverythingIsEmpty) {
    EXPECT_TRUE(change_log.changesSince(3.5).empty());
    EXPECT_EQ(change_log.suffixStart(3.5), change_log.size());
}

TEST(ChangeLogEmptyTest, EmptyLogHasNoChanges) {
    ChangeLog change_log;
    EXPECT_TRUE(change_log.empty());
    EXPECT_TRUE(change_log.changesSince(0.0).empty());
}

TEST(ChangeLogEmptyTest, OutOfOrderTimestampIsStillAppended) {
    ChangeLog change_log;
    change_log.append(5.0, {Route{"site", "late"}});
    change_log.append(4.0, {Route{"site", "early"}});

    ASSERT_EQ(change_log.size(), 2u);
    EXPECT_EQ(change_log.history()[1].timestamp, 4.0);
}

TEST(ChangeLogRetentionTest, PolicyRunsAfterEveryAppend) {
    ChangeLog change_log;
    auto policy = std::make_unique<KeepLastPolicy>(2);
    KeepLastPolicy* raw = policy.get();
    change_log.setRetentionPolicy(std::move(policy));

    change_log.append(1.0, {Route{"site", "a"}});
    change_log.append(2.0, {Route{"site", "b"}});
    change_log.append(3.0, {Route{"site", "c"}});

    EXPECT_EQ(raw->calls, 3);
    ASSERT_EQ(change_log.size(), 2u);
    EXPECT_EQ(change_log.history()[0].route, (Route{"site", "b"}));
    EXPECT_EQ(change_log.changesSince(0.0).size(), 2u);
}

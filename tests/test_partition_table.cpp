/**
 * @file test_partition_table.cpp
 * @brief Unit tests for PartitionTable and route resolution
 * @author SimpleDaemons
 * @copyright 2024 SimpleDaemons
 * @license Apache-2.0
 */

#include <gtest/gtest.h>
#include "simple_vfsd/partition_table.hpp"
#include "simple_vfsd/vfs_error.hpp"

using SimpleVfsd::PartitionTable;
using SimpleVfsd::Route;

class PartitionTableTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(table.addPartition("site", "/tmp/site"));
    }

    PartitionTable table;
};

TEST_F(PartitionTableTest, ResolvesPartitionRootWithoutTrailingSeparator) {
    std::filesystem::path path = table.resolve(Route{"site"});

    EXPECT_EQ(path, std::filesystem::path("/tmp/site"));
    EXPECT_EQ(path.string().back(), 'e');
}

TEST_F(PartitionTableTest, ResolvesNestedRoute) {
    EXPECT_EQ(table.resolve(Route{"site", "posts", "foo.md"}),
              std::filesystem::path("/tmp/site/posts/foo.md"));
}

TEST_F(PartitionTableTest, LeadingSlashesStayInsidePartition) {
    EXPECT_EQ(table.resolve(Route{"site", "/etc", "passwd"}),
              std::filesystem::path("/tmp/site/etc/passwd"));
}

TEST_F(PartitionTableTest, UnknownPartitionThrowsRouteError) {
    EXPECT_THROW(table.resolve(Route{"unknown", "x"}), SimpleVfsd::RouteError);
}

TEST_F(PartitionTableTest, EmptyRouteThrowsRouteError) {
    EXPECT_THROW(table.resolve(Route{}), SimpleVfsd::RouteError);
}

TEST_F(PartitionTableTest, RejectsRelativeRoot) {
    EXPECT_FALSE(table.addPartition("docs", "relative/docs"));
    EXPECT_FALSE(table.hasPartition("docs"));
    EXPECT_EQ(table.size(), 1u);
}

TEST_F(PartitionTableTest, RejectsInvalidNames) {
    EXPECT_FALSE(table.addPartition("", "/tmp/empty"));
    EXPECT_FALSE(table.addPartition("a/b", "/tmp/ab"));
    EXPECT_EQ(table.size(), 1u);
}

TEST_F(PartitionTableTest, LastRegistrationWins) {
    EXPECT_TRUE(table.addPartition("site", "/srv/site"));

    EXPECT_EQ(table.size(), 1u);
    EXPECT_EQ(table.rootOf("site"), std::filesystem::path("/srv/site"));
    EXPECT_EQ(table.resolve(Route{"site"}), std::filesystem::path("/srv/site"));
}

TEST_F(PartitionTableTest, ListsNames) {
    ASSERT_TRUE(table.addPartition("assets", "/tmp/assets"));

    std::vector<std::string> names = table.names();
    ASSERT_EQ(names.size(), 2u);
    EXPECT_EQ(names[0], "assets");
    EXPECT_EQ(names[1], "site");
    EXPECT_THROW(table.rootOf("missing"), SimpleVfsd::RouteError);
}

TEST_F(PartitionTableTest, RouteErrorCarriesRoute) {
    try {
        table.resolve(Route{"nope", "a"});
        FAIL() << "Expected RouteError";
    } catch (const SimpleVfsd::RouteError& e) {
        EXPECT_EQ(e.route(), (Route{"nope", "a"}));
        EXPECT_NE(std::string(e.what()).find("nope"), std::string::npos);
    }
}

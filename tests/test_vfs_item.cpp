/**
 * @file test_vfs_item.cpp
 * @brief Tests for snapshot nodes
 * @author SimpleDaemons
 * @copyright 2024 SimpleDaemons
 * @license Apache-2.0
 */

#include <gtest/gtest.h>
#include "simple_vfsd/vfs_item.hpp"
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using SimpleVfsd::Route;
using SimpleVfsd::VfsChildren;
using SimpleVfsd::VfsDir;
using SimpleVfsd::VfsFile;
using SimpleVfsd::VfsItem;

namespace {

VfsItem file(const std::string& name, const std::string& contents) {
    return VfsItem(VfsFile{Route{"site", name}, contents});
}

} // namespace

TEST(VfsChildrenTest, IteratesInNameOrder) {
    VfsChildren children;
    EXPECT_TRUE(children.empty());

    EXPECT_TRUE(children.emplace("posts", VfsItem(VfsDir{Route{"site", "posts"}, {}})));
    EXPECT_TRUE(children.emplace("index.html", file("index.html", "hi")));
    EXPECT_TRUE(children.emplace("about.md", file("about.md", "# About")));

    std::vector<std::string> names;
    for (const auto& pair : children) {
        names.push_back(pair.first);
    }
    EXPECT_EQ(names, (std::vector<std::string>{"about.md", "index.html", "posts"}));
    EXPECT_EQ(children.size(), 3u);
}

TEST(VfsChildrenTest, DuplicateNameKeepsFirstChild) {
    VfsChildren children;
    EXPECT_TRUE(children.emplace("a.txt", file("a.txt", "first")));
    EXPECT_FALSE(children.emplace("a.txt", file("a.txt", "second")));

    EXPECT_EQ(children.size(), 1u);
    EXPECT_EQ(children.at("a.txt").file().contents, "first");
}

TEST(VfsChildrenTest, LookupByName) {
    VfsChildren children;
    children.emplace("a.txt", file("a.txt", "a"));

    EXPECT_EQ(children.count("a.txt"), 1u);
    EXPECT_EQ(children.count("b.txt"), 0u);
    ASSERT_NE(children.find("a.txt"), nullptr);
    EXPECT_EQ(children.find("b.txt"), nullptr);
    EXPECT_THROW(children.at("b.txt"), std::out_of_range);
}

TEST(VfsItemTest, NestedDirectoriesCompareByValue) {
    VfsDir posts{Route{"site", "posts"}, {}};
    posts.children.emplace("foo.md", VfsItem(VfsFile{Route{"site", "posts", "foo.md"}, "# Foo"}));

    VfsDir root{Route{"site"}, {}};
    root.children.emplace("posts", VfsItem(posts));

    VfsItem copy = VfsItem(root);
    EXPECT_TRUE(copy == VfsItem(root));
    EXPECT_EQ(copy.dir().children.at("posts").dir().children.at("foo.md").name(), "foo.md");

    posts.children.emplace("bar.md", VfsItem(VfsFile{Route{"site", "posts", "bar.md"}, "# Bar"}));
    VfsDir changed{Route{"site"}, {}};
    changed.children.emplace("posts", VfsItem(std::move(posts)));
    EXPECT_FALSE(copy == VfsItem(changed));
}

TEST(VfsItemTest, AccessorsFollowVariant) {
    VfsItem item = file("index.html", "hi");
    EXPECT_TRUE(item.isFile());
    EXPECT_FALSE(item.isDir());
    EXPECT_EQ(item.route(), (Route{"site", "index.html"}));
    EXPECT_EQ(item.name(), "index.html");
}

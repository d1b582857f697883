/**
 * @file test_serialization.cpp
 * @brief Unit tests for JSON encoding of snapshots and changes
 * @author SimpleDaemons
 * @copyright 2024 SimpleDaemons
 * @license Apache-2.0
 */

#include <gtest/gtest.h>
#include "simple_vfsd/serialization.hpp"
#include <stdexcept>

using SimpleVfsd::Route;
using SimpleVfsd::VfsDir;
using SimpleVfsd::VfsFile;
using SimpleVfsd::VfsItem;

namespace {

VfsItem sampleTree() {
    VfsDir posts;
    posts.route = Route{"site", "posts"};
    posts.children.emplace("foo.md", VfsItem(VfsFile{Route{"site", "posts", "foo.md"}, "# Foo"}));

    VfsDir root;
    root.route = Route{"site"};
    root.children.emplace("index.html", VfsItem(VfsFile{Route{"site", "index.html"}, "hi"}));
    root.children.emplace("posts", VfsItem(std::move(posts)));
    return VfsItem(std::move(root));
}

} // namespace

TEST(SerializationTest, FileNodeLayout) {
    Json::Value value = SimpleVfsd::toJson(VfsItem(VfsFile{Route{"site", "index.html"}, "hi"}));

    EXPECT_EQ(value["type"].asString(), "file");
    ASSERT_TRUE(value["route"].isArray());
    ASSERT_EQ(value["route"].size(), 2u);
    EXPECT_EQ(value["route"][0].asString(), "site");
    EXPECT_EQ(value["route"][1].asString(), "index.html");
    EXPECT_EQ(value["contents"].asString(), "hi");
    EXPECT_FALSE(value.isMember("children"));
}

TEST(SerializationTest, DirNodeLayout) {
    Json::Value value = SimpleVfsd::toJson(sampleTree());

    EXPECT_EQ(value["type"].asString(), "dir");
    ASSERT_TRUE(value["children"].isObject());
    EXPECT_EQ(value["children"].size(), 2u);
    EXPECT_EQ(value["children"]["posts"]["type"].asString(), "dir");
    EXPECT_EQ(value["children"]["posts"]["children"]["foo.md"]["contents"].asString(), "# Foo");
    EXPECT_FALSE(value.isMember("contents"));
}

TEST(SerializationTest, ChangeRecordLayout) {
    Json::Value value = SimpleVfsd::toJson(SimpleVfsd::VfsChange(1.25, Route{"site", "a.txt"}));

    EXPECT_DOUBLE_EQ(value["timestamp"].asDouble(), 1.25);
    EXPECT_EQ(value["route"][1].asString(), "a.txt");
}

TEST(SerializationTest, DecodesWrittenSnapshot) {
    VfsItem original = sampleTree();
    std::string text = SimpleVfsd::writeJson(SimpleVfsd::toJson(original));

    VfsItem decoded = SimpleVfsd::itemFromJson(SimpleVfsd::parseJson(text));
    EXPECT_EQ(decoded, original);
}

TEST(SerializationTest, DecodesChangeList) {
    std::vector<SimpleVfsd::VfsChange> changes{
        SimpleVfsd::VfsChange(1.0, Route{"site", "a"}),
        SimpleVfsd::VfsChange(2.0, Route{"site", "b"})
    };
    Json::Value array = SimpleVfsd::toJson(changes);

    ASSERT_EQ(array.size(), 2u);
    EXPECT_EQ(SimpleVfsd::changeFromJson(array[1]), changes[1]);
}

TEST(SerializationTest, RejectsMissingOrUnknownType) {
    Json::Value no_type(Json::objectValue);
    no_type["route"] = SimpleVfsd::routeToJson(Route{"site"});
    EXPECT_THROW(SimpleVfsd::itemFromJson(no_type), std::runtime_error);

    Json::Value bad_type = no_type;
    bad_type["type"] = "symlink";
    EXPECT_THROW(SimpleVfsd::itemFromJson(bad_type), std::runtime_error);
}

TEST(SerializationTest, RejectsMalformedFields) {
    Json::Value file(Json::objectValue);
    file["type"] = "file";
    file["route"] = "site/index.html";
    file["contents"] = "hi";
    EXPECT_THROW(SimpleVfsd::itemFromJson(file), std::runtime_error);

    Json::Value change(Json::objectValue);
    change["timestamp"] = "soon";
    change["route"] = SimpleVfsd::routeToJson(Route{"site"});
    EXPECT_THROW(SimpleVfsd::changeFromJson(change), std::runtime_error);

    EXPECT_THROW(SimpleVfsd::parseJson("{\"type\": "), std::runtime_error);
}

TEST(SerializationTest, PrettyOutputIsIndented) {
    std::string compact = SimpleVfsd::writeJson(SimpleVfsd::toJson(sampleTree()));
    std::string pretty = SimpleVfsd::writeJson(SimpleVfsd::toJson(sampleTree()), true);

    EXPECT_EQ(compact.find('\n'), std::string::npos);
    EXPECT_NE(pretty.find('\n'), std::string::npos);
}

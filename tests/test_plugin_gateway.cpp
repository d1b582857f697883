/**
 * @file test_plugin_gateway.cpp
 * @brief Unit tests for PassthroughGateway and PluginChain
 * @author SimpleDaemons
 * @copyright 2024 SimpleDaemons
 * @license Apache-2.0
 */

#include <gtest/gtest.h>
#include "simple_vfsd/plugin_gateway.hpp"

using SimpleVfsd::Route;

namespace {

// Drops routes whose last segment starts with '.'
class HiddenFilePlugin : public SimpleVfsd::Plugin {
public:
    std::optional<std::vector<Route>> handleFileChange(const Route& route) const override {
        if (!route.empty() && !route.back().empty() && route.back()[0] == '.') {
            return std::nullopt;
        }
        return std::vector<Route>{route};
    }
};

// Reports a markdown source change as the source plus its rendered page
class MarkdownPlugin : public SimpleVfsd::Plugin {
public:
    std::optional<std::vector<Route>> handleFileChange(const Route& route) const override {
        const std::string suffix = ".md";
        if (route.empty() || route.back().size() <= suffix.size() ||
            route.back().compare(route.back().size() - suffix.size(), suffix.size(), suffix) != 0) {
            return std::vector<Route>{route};
        }

        Route page = route;
        page.back() = page.back().substr(0, page.back().size() - suffix.size()) + ".html";
        return std::vector<Route>{route, page};
    }
};

} // namespace

TEST(PassthroughGatewayTest, ReturnsRouteUnchanged) {
    SimpleVfsd::PassthroughGateway gateway;
    auto routes = gateway.handleFileChange(Route{"site", "index.html"});

    ASSERT_TRUE(routes.has_value());
    ASSERT_EQ(routes->size(), 1u);
    EXPECT_EQ(routes->front(), (Route{"site", "index.html"}));
}

TEST(PluginChainTest, EmptyChainPassesThrough) {
    SimpleVfsd::PluginChain chain;
    auto routes = chain.handleFileChange(Route{"site", "a.txt"});

    ASSERT_TRUE(routes.has_value());
    EXPECT_EQ(*routes, (std::vector<Route>{Route{"site", "a.txt"}}));
}

TEST(PluginChainTest, ExpandsThroughEveryPlugin) {
    SimpleVfsd::PluginChain chain;
    chain.addPlugin(std::make_unique<HiddenFilePlugin>());
    chain.addPlugin(std::make_unique<MarkdownPlugin>());
    EXPECT_EQ(chain.size(), 2u);

    auto routes = chain.handleFileChange(Route{"site", "posts", "foo.md"});

    ASSERT_TRUE(routes.has_value());
    ASSERT_EQ(routes->size(), 2u);
    EXPECT_EQ((*routes)[0], (Route{"site", "posts", "foo.md"}));
    EXPECT_EQ((*routes)[1], (Route{"site", "posts", "foo.html"}));
}

TEST(PluginChainTest, SuppressedRouteYieldsNoChanges) {
    SimpleVfsd::PluginChain chain;
    chain.addPlugin(std::make_unique<HiddenFilePlugin>());
    chain.addPlugin(std::make_unique<MarkdownPlugin>());

    EXPECT_FALSE(chain.handleFileChange(Route{"site", ".swp"}).has_value());
}

TEST(PluginChainTest, IgnoresNullPlugin) {
    SimpleVfsd::PluginChain chain;
    chain.addPlugin(nullptr);
    EXPECT_EQ(chain.size(), 0u);
}

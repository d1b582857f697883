/**
 * @file plugin_gateway.hpp
 * @brief Expansion of raw changed routes into logical routes
 * @author SimpleDaemons
 * @copyright 2024 SimpleDaemons
 * @license Apache-2.0
 */

#ifndef SIMPLE_VFSD_PLUGIN_GATEWAY_HPP
#define SIMPLE_VFSD_PLUGIN_GATEWAY_HPP

#include "simple_vfsd/route.hpp"
#include <memory>
#include <optional>
#include <vector>

namespace SimpleVfsd {

// Synchronous, deterministic expansion of one raw changed route.
// std::nullopt (or an empty list) means the change is suppressed.
class PluginGateway {
public:
    virtual ~PluginGateway() = default;

    virtual std::optional<std::vector<Route>> handleFileChange(const Route& route) const = 0;
};

// Reports every change as-is
class PassthroughGateway : public PluginGateway {
public:
    std::optional<std::vector<Route>> handleFileChange(const Route& route) const override;
};

// A single transformation step inside a PluginChain
class Plugin {
public:
    virtual ~Plugin() = default;

    virtual std::optional<std::vector<Route>> handleFileChange(const Route& route) const = 0;
};

// Runs routes through each plugin in order. Every route a plugin produces
// is fed to the next plugin; a route a plugin suppresses goes no further.
// An empty chain passes routes through unchanged.
class PluginChain : public PluginGateway {
public:
    PluginChain() = default;

    void addPlugin(std::unique_ptr<Plugin> plugin);
    size_t size() const { return plugins_.size(); }

    std::optional<std::vector<Route>> handleFileChange(const Route& route) const override;

private:
    std::vector<std::unique_ptr<Plugin>> plugins_;
};

} // namespace SimpleVfsd

#endif // SIMPLE_VFSD_PLUGIN_GATEWAY_HPP

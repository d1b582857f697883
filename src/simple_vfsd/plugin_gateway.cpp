#include "simple_vfsd/plugin_gateway.hpp"

namespace SimpleVfsd {

std::optional<std::vector<Route>> PassthroughGateway::handleFileChange(const Route& route) const {
    return std::vector<Route>{route};
}

void PluginChain::addPlugin(std::unique_ptr<Plugin> plugin) {
    if (plugin) {
        plugins_.push_back(std::move(plugin));
    }
}

std::optional<std::vector<Route>> PluginChain::handleFileChange(const Route& route) const {
    std::vector<Route> current{route};

    for (const auto& plugin : plugins_) {
        std::vector<Route> next;
        for (const auto& input : current) {
            auto produced = plugin->handleFileChange(input);
            if (!produced) {
                continue;
            }
            next.insert(next.end(), produced->begin(), produced->end());
        }

        current = std::move(next);
        if (current.empty()) {
            return std::nullopt;
        }
    }

    return current;
}

} // namespace SimpleVfsd

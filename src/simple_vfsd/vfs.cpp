/**
 * @file vfs.cpp
 * @brief Vfs facade implementation
 * @author SimpleDaemons
 * @copyright 2024 SimpleDaemons
 * @license Apache-2.0
 */

#include "simple_vfsd/vfs.hpp"
#include "simple_vfsd/logger.hpp"
#include "simple_vfsd/vfs_error.hpp"

namespace SimpleVfsd {

namespace {

std::string describeRoutes(const std::vector<Route>& routes) {
    std::string result = "[";
    for (size_t i = 0; i < routes.size(); ++i) {
        if (i > 0) {
            result += ", ";
        }
        result += routeToString(routes[i]);
    }
    return result + "]";
}

} // namespace

Vfs::Vfs(const PluginGateway& gateway, bool verbose)
    : reader_(partitions_), gateway_(gateway), verbose_(verbose) {
}

bool Vfs::addPartition(const std::string& name, const std::filesystem::path& root) {
    return partitions_.addPartition(name, root);
}

std::filesystem::path Vfs::resolve(const Route& route) const {
    return partitions_.resolve(route);
}

VfsItem Vfs::read(const Route& route) const {
    return reader_.read(route);
}

VfsItem Vfs::read(const Route& route, std::vector<SkippedEntry>& skipped) const {
    return reader_.read(route, &skipped);
}

double Vfs::currentTime() const {
    return clock_.now();
}

void Vfs::addChange(double timestamp, const Route& route) {
    if (verbose_) {
        Logger::info("Received change " + routeToString(route) + ", running through plugins...");
    }

    auto routes = gateway_.handleFileChange(route);
    if (!routes || routes->empty()) {
        return;
    }

    if (verbose_) {
        Logger::info("Adding changes from plugin: " + describeRoutes(*routes));
    }

    change_log_.append(timestamp, *routes);
}

std::vector<VfsChange> Vfs::changesSince(double timestamp) const {
    return change_log_.changesSince(timestamp);
}

void Vfs::write(const Route& route, const VfsItem& item) {
    (void)item;
    throw UnsupportedOperationError("write", route);
}

void Vfs::remove(const Route& route) {
    throw UnsupportedOperationError("delete", route);
}

} // namespace SimpleVfsd

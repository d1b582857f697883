#include "simple_vfsd/partition_table.hpp"
#include "simple_vfsd/logger.hpp"
#include "simple_vfsd/vfs_error.hpp"

namespace SimpleVfsd {

bool PartitionTable::addPartition(const std::string& name, const std::filesystem::path& root) {
    if (name.empty() || name.find('/') != std::string::npos) {
        Logger::error("Invalid partition name: '" + name + "'");
        return false;
    }

    if (!root.is_absolute()) {
        Logger::error("Partition '" + name + "' root must be absolute: " + root.string());
        return false;
    }

    auto it = partitions_.find(name);
    if (it != partitions_.end() && it->second != root) {
        Logger::warn("Partition '" + name + "' remapped from " + it->second.string() + " to " + root.string());
    }

    partitions_[name] = root;
    Logger::debug("Registered partition '" + name + "' at " + root.string());
    return true;
}

bool PartitionTable::hasPartition(const std::string& name) const {
    return partitions_.find(name) != partitions_.end();
}

const std::filesystem::path& PartitionTable::rootOf(const std::string& name) const {
    auto it = partitions_.find(name);
    if (it == partitions_.end()) {
        throw RouteError(Route{name});
    }
    return it->second;
}

std::vector<std::string> PartitionTable::names() const {
    std::vector<std::string> result;
    result.reserve(partitions_.size());
    for (const auto& pair : partitions_) {
        result.push_back(pair.first);
    }
    return result;
}

std::filesystem::path PartitionTable::resolve(const Route& route) const {
    if (route.empty()) {
        throw RouteError(route);
    }

    auto it = partitions_.find(route.front());
    if (it == partitions_.end()) {
        throw RouteError(route);
    }

    // Joining an empty relative part would leave a trailing separator
    if (route.size() == 1) {
        return it->second;
    }

    std::filesystem::path full_path = it->second;
    for (size_t i = 1; i < route.size(); ++i) {
        // Leading slashes would make the segment replace the root
        size_t first = route[i].find_first_not_of('/');
        if (first == std::string::npos) {
            continue;
        }
        full_path /= route[i].substr(first);
    }

    return full_path;
}

} // namespace SimpleVfsd

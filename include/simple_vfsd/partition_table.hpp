/**
 * @file partition_table.hpp
 * @brief Partition registry and route resolution
 * @author SimpleDaemons
 * @copyright 2024 SimpleDaemons
 * @license Apache-2.0
 */

#ifndef SIMPLE_VFSD_PARTITION_TABLE_HPP
#define SIMPLE_VFSD_PARTITION_TABLE_HPP

#include "simple_vfsd/route.hpp"
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace SimpleVfsd {

// Maps partition names to absolute physical roots. Populated during setup,
// read-only once read and change traffic starts.
class PartitionTable {
public:
    PartitionTable() = default;

    // Register or replace a partition. Rejects empty names, names holding
    // a '/' and relative roots, leaving the table untouched.
    bool addPartition(const std::string& name, const std::filesystem::path& root);

    bool hasPartition(const std::string& name) const;

    // Throws RouteError for an unknown name
    const std::filesystem::path& rootOf(const std::string& name) const;

    std::vector<std::string> names() const;
    size_t size() const { return partitions_.size(); }
    bool empty() const { return partitions_.empty(); }

    // Translate a route into a physical path. A route holding only the
    // partition name yields the root itself, without a trailing separator.
    // Throws RouteError if the route is empty or the partition is unknown.
    std::filesystem::path resolve(const Route& route) const;

private:
    std::map<std::string, std::filesystem::path> partitions_;
};

} // namespace SimpleVfsd

#endif // SIMPLE_VFSD_PARTITION_TABLE_HPP

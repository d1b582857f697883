/**
 * @file vfs.hpp
 * @brief Virtual filesystem overlay over named partitions
 * @author SimpleDaemons
 * @copyright 2024 SimpleDaemons
 * @license Apache-2.0
 */

#ifndef SIMPLE_VFSD_VFS_HPP
#define SIMPLE_VFSD_VFS_HPP

#include "simple_vfsd/change_log.hpp"
#include "simple_vfsd/partition_table.hpp"
#include "simple_vfsd/plugin_gateway.hpp"
#include "simple_vfsd/tree_reader.hpp"
#include "simple_vfsd/vfs_item.hpp"
#include <filesystem>
#include <vector>

namespace SimpleVfsd {

// Symbolic layer over several physical roots, with a change history.
//
// No internal locking: read(), currentTime() and changesSince() only need
// shared access, addChange() needs exclusive access. Callers sharing a Vfs
// between threads must serialize writers against readers themselves.
class Vfs {
public:
    // gateway must outlive the Vfs
    explicit Vfs(const PluginGateway& gateway, bool verbose = false);

    Vfs(const Vfs&) = delete;
    Vfs& operator=(const Vfs&) = delete;

    // Partition setup, before read/change traffic starts
    bool addPartition(const std::string& name, const std::filesystem::path& root);
    PartitionTable& partitions() { return partitions_; }
    const PartitionTable& partitions() const { return partitions_; }

    std::filesystem::path resolve(const Route& route) const;

    VfsItem read(const Route& route) const;
    VfsItem read(const Route& route, std::vector<SkippedEntry>& skipped) const;

    // Seconds since construction, never decreasing
    double currentTime() const;

    // Expand route through the gateway and record each result at timestamp
    void addChange(double timestamp, const Route& route);

    std::vector<VfsChange> changesSince(double timestamp) const;
    const std::vector<VfsChange>& changeHistory() const { return change_log_.history(); }
    ChangeLog& changeLog() { return change_log_; }

    // Not implemented; always throw UnsupportedOperationError
    void write(const Route& route, const VfsItem& item);
    void remove(const Route& route);

    bool isVerbose() const { return verbose_; }
    void setVerbose(bool verbose) { verbose_ = verbose; }

private:
    PartitionTable partitions_;
    TreeReader reader_;
    Clock clock_;
    ChangeLog change_log_;
    const PluginGateway& gateway_;
    bool verbose_;
};

} // namespace SimpleVfsd

#endif // SIMPLE_VFSD_VFS_HPP

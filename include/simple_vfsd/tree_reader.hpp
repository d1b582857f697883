/**
 * @file tree_reader.hpp
 * @brief Recursive snapshot reader over partitioned directories
 * @author SimpleDaemons
 * @copyright 2024 SimpleDaemons
 * @license Apache-2.0
 */

#ifndef SIMPLE_VFSD_TREE_READER_HPP
#define SIMPLE_VFSD_TREE_READER_HPP

#include "simple_vfsd/partition_table.hpp"
#include "simple_vfsd/vfs_item.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace SimpleVfsd {

// A child that was left out of its parent's snapshot
struct SkippedEntry {
    Route route;
    std::string reason;
};

class TreeReader {
public:
    explicit TreeReader(const PartitionTable& partitions);

    // Eagerly materialize the entry at route and everything below it.
    //
    // A partition root that is a symlink is followed; symlinks below it are
    // unsupported. Failures of the entry itself propagate (RouteError,
    // ReadError, UnsupportedTypeError). Failures of nested children only drop that
    // child from its parent; when skipped is given, each dropped child is
    // appended to it.
    VfsItem read(const Route& route, std::vector<SkippedEntry>* skipped = nullptr) const;

private:
    const PartitionTable& partitions_;

    VfsItem readPath(const Route& route, const std::filesystem::path& path,
                     std::vector<SkippedEntry>* skipped, bool follow_symlink = false) const;
    VfsItem readDirectory(const Route& route, const std::filesystem::path& path,
                          std::vector<SkippedEntry>* skipped) const;
    VfsItem readFile(const Route& route, const std::filesystem::path& path) const;
};

// True if data is well-formed UTF-8
bool isValidUtf8(const std::string& data);

} // namespace SimpleVfsd

#endif // SIMPLE_VFSD_TREE_READER_HPP

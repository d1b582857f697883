/**
 * @file vfs_item.hpp
 * @brief In-memory snapshot nodes and change records
 * @author SimpleDaemons
 * @copyright 2024 SimpleDaemons
 * @license Apache-2.0
 */

#ifndef SIMPLE_VFSD_VFS_ITEM_HPP
#define SIMPLE_VFSD_VFS_ITEM_HPP

#include "simple_vfsd/route.hpp"
#include <cstddef>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace SimpleVfsd {

struct VfsItem;

// Regular file with its full text contents
struct VfsFile {
    Route route;
    std::string contents;
};

// Name-ordered children of a directory. Stored in a vector because
// VfsItem is still incomplete here, which only vector allows.
class VfsChildren {
public:
    using value_type = std::pair<std::string, VfsItem>;
    using const_iterator = std::vector<value_type>::const_iterator;

    // False, leaving the existing child in place, if name is taken
    bool emplace(const std::string& name, VfsItem item);

    // Throws std::out_of_range for an unknown name
    const VfsItem& at(const std::string& name) const;
    const VfsItem* find(const std::string& name) const;
    size_t count(const std::string& name) const;

    size_t size() const;
    bool empty() const;
    const_iterator begin() const;
    const_iterator end() const;

    friend bool operator==(const VfsChildren& lhs, const VfsChildren& rhs);

private:
    std::vector<value_type> entries_;

    std::vector<value_type>::const_iterator lowerBound(const std::string& name) const;
};

// Directory with every readable child, keyed by child name
struct VfsDir {
    Route route;
    VfsChildren children;
};

// Snapshot node: exactly one of VfsFile or VfsDir.
// Every child's route is its parent's route plus the child name.
struct VfsItem {
    std::variant<VfsFile, VfsDir> node;

    VfsItem(VfsFile file) : node(std::move(file)) {}
    VfsItem(VfsDir dir) : node(std::move(dir)) {}

    bool isFile() const { return std::holds_alternative<VfsFile>(node); }
    bool isDir() const { return std::holds_alternative<VfsDir>(node); }

    // Throw std::bad_variant_access on the wrong variant
    const VfsFile& file() const { return std::get<VfsFile>(node); }
    const VfsDir& dir() const { return std::get<VfsDir>(node); }

    const Route& route() const;

    // Last route segment; empty for an empty route
    std::string name() const;
};

bool operator==(const VfsFile& lhs, const VfsFile& rhs);
bool operator==(const VfsDir& lhs, const VfsDir& rhs);
bool operator==(const VfsItem& lhs, const VfsItem& rhs);

// One recorded change; timestamp is seconds since the Vfs was created
struct VfsChange {
    double timestamp;
    Route route;

    VfsChange() : timestamp(0.0) {}
    VfsChange(double ts, const Route& r) : timestamp(ts), route(r) {}
};

bool operator==(const VfsChange& lhs, const VfsChange& rhs);

} // namespace SimpleVfsd

#endif // SIMPLE_VFSD_VFS_ITEM_HPP

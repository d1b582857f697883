#include "simple_vfsd/vfs_item.hpp"
#include <algorithm>
#include <stdexcept>

namespace SimpleVfsd {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};

template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace

std::vector<VfsChildren::value_type>::const_iterator VfsChildren::lowerBound(const std::string& name) const {
    return std::lower_bound(entries_.begin(), entries_.end(), name,
                            [](const value_type& entry, const std::string& key) { return entry.first < key; });
}

bool VfsChildren::emplace(const std::string& name, VfsItem item) {
    auto it = lowerBound(name);
    if (it != entries_.end() && it->first == name) {
        return false;
    }
    entries_.emplace(it, name, std::move(item));
    return true;
}

const VfsItem& VfsChildren::at(const std::string& name) const {
    const VfsItem* item = find(name);
    if (!item) {
        throw std::out_of_range("No child named '" + name + "'");
    }
    return *item;
}

const VfsItem* VfsChildren::find(const std::string& name) const {
    auto it = lowerBound(name);
    if (it == entries_.end() || it->first != name) {
        return nullptr;
    }
    return &it->second;
}

size_t VfsChildren::count(const std::string& name) const {
    return find(name) ? 1 : 0;
}

size_t VfsChildren::size() const {
    return entries_.size();
}

bool VfsChildren::empty() const {
    return entries_.empty();
}

VfsChildren::const_iterator VfsChildren::begin() const {
    return entries_.begin();
}

VfsChildren::const_iterator VfsChildren::end() const {
    return entries_.end();
}

bool operator==(const VfsChildren& lhs, const VfsChildren& rhs) {
    return lhs.entries_ == rhs.entries_;
}

const Route& VfsItem::route() const {
    return std::visit(Overloaded{
        [](const VfsFile& file) -> const Route& { return file.route; },
        [](const VfsDir& dir) -> const Route& { return dir.route; }
    }, node);
}

std::string VfsItem::name() const {
    const Route& r = route();
    return r.empty() ? std::string() : r.back();
}

bool operator==(const VfsFile& lhs, const VfsFile& rhs) {
    return lhs.route == rhs.route && lhs.contents == rhs.contents;
}

bool operator==(const VfsDir& lhs, const VfsDir& rhs) {
    return lhs.route == rhs.route && lhs.children == rhs.children;
}

bool operator==(const VfsItem& lhs, const VfsItem& rhs) {
    return lhs.node == rhs.node;
}

bool operator==(const VfsChange& lhs, const VfsChange& rhs) {
    return lhs.timestamp == rhs.timestamp && lhs.route == rhs.route;
}

} // namespace SimpleVfsd

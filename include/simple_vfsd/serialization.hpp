/**
 * @file serialization.hpp
 * @brief JSON encoding of snapshots and change records
 * @author SimpleDaemons
 * @copyright 2024 SimpleDaemons
 * @license Apache-2.0
 */

#ifndef SIMPLE_VFSD_SERIALIZATION_HPP
#define SIMPLE_VFSD_SERIALIZATION_HPP

#include "simple_vfsd/vfs_item.hpp"
#include <json/json.h>
#include <string>
#include <vector>

namespace SimpleVfsd {

// File: {"type": "file", "route": [...], "contents": "..."}
// Dir:  {"type": "dir", "route": [...], "children": {"name": node, ...}}
Json::Value toJson(const VfsItem& item);

// {"timestamp": 1.5, "route": [...]}
Json::Value toJson(const VfsChange& change);
Json::Value toJson(const std::vector<VfsChange>& changes);

Json::Value routeToJson(const Route& route);

// Decoders throw std::runtime_error on malformed input
VfsItem itemFromJson(const Json::Value& value);
VfsChange changeFromJson(const Json::Value& value);
Route routeFromJson(const Json::Value& value);

std::string writeJson(const Json::Value& value, bool pretty = false);
Json::Value parseJson(const std::string& text);

} // namespace SimpleVfsd

#endif // SIMPLE_VFSD_SERIALIZATION_HPP

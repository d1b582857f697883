/**
 * @file serialization.cpp
 * @brief JSON encoding of snapshots and change records
 * @author SimpleDaemons
 * @copyright 2024 SimpleDaemons
 * @license Apache-2.0
 */

#include "simple_vfsd/serialization.hpp"
#include <memory>
#include <sstream>
#include <stdexcept>

namespace SimpleVfsd {

Json::Value routeToJson(const Route& route) {
    Json::Value array(Json::arrayValue);
    for (const auto& segment : route) {
        array.append(segment);
    }
    return array;
}

Json::Value toJson(const VfsItem& item) {
    Json::Value value(Json::objectValue);

    if (item.isFile()) {
        const VfsFile& file = item.file();
        value["type"] = "file";
        value["route"] = routeToJson(file.route);
        value["contents"] = file.contents;
    } else {
        const VfsDir& dir = item.dir();
        value["type"] = "dir";
        value["route"] = routeToJson(dir.route);

        Json::Value children(Json::objectValue);
        for (const auto& pair : dir.children) {
            children[pair.first] = toJson(pair.second);
        }
        value["children"] = children;
    }

    return value;
}

Json::Value toJson(const VfsChange& change) {
    Json::Value value(Json::objectValue);
    value["timestamp"] = change.timestamp;
    value["route"] = routeToJson(change.route);
    return value;
}

Json::Value toJson(const std::vector<VfsChange>& changes) {
    Json::Value array(Json::arrayValue);
    for (const auto& change : changes) {
        array.append(toJson(change));
    }
    return array;
}

Route routeFromJson(const Json::Value& value) {
    if (!value.isArray()) {
        throw std::runtime_error("Invalid route: expected an array of strings");
    }

    Route route;
    for (const auto& segment : value) {
        if (!segment.isString()) {
            throw std::runtime_error("Invalid route: segment is not a string");
        }
        route.push_back(segment.asString());
    }
    return route;
}

VfsItem itemFromJson(const Json::Value& value) {
    if (!value.isObject() || !value.isMember("type") || !value["type"].isString()) {
        throw std::runtime_error("Invalid item: missing type discriminator");
    }

    const std::string type = value["type"].asString();
    Route route = routeFromJson(value["route"]);

    if (type == "file") {
        const Json::Value& contents = value["contents"];
        if (!contents.isString()) {
            throw std::runtime_error("Invalid file item: contents must be a string");
        }
        return VfsItem(VfsFile{route, contents.asString()});
    }

    if (type == "dir") {
        const Json::Value& children = value["children"];
        if (!children.isObject()) {
            throw std::runtime_error("Invalid dir item: children must be an object");
        }

        VfsDir dir;
        dir.route = route;
        for (const auto& name : children.getMemberNames()) {
            dir.children.emplace(name, itemFromJson(children[name]));
        }
        return VfsItem(std::move(dir));
    }

    throw std::runtime_error("Invalid item type: " + type);
}

VfsChange changeFromJson(const Json::Value& value) {
    if (!value.isObject() || !value["timestamp"].isNumeric()) {
        throw std::runtime_error("Invalid change: timestamp must be a number");
    }
    return VfsChange(value["timestamp"].asDouble(), routeFromJson(value["route"]));
}

std::string writeJson(const Json::Value& value, bool pretty) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = pretty ? "  " : "";
    return Json::writeString(builder, value);
}

Json::Value parseJson(const std::string& text) {
    Json::Value root;
    Json::CharReaderBuilder builder;
    std::string errors;
    std::istringstream stream(text);

    if (!Json::parseFromStream(builder, stream, &root, &errors)) {
        throw std::runtime_error("Failed to parse JSON: " + errors);
    }
    return root;
}

} // namespace SimpleVfsd

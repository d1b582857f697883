/**
 * @file route.hpp
 * @brief Symbolic routes addressing items inside partitions
 * @author SimpleDaemons
 * @copyright 2024 SimpleDaemons
 * @license Apache-2.0
 */

#ifndef SIMPLE_VFSD_ROUTE_HPP
#define SIMPLE_VFSD_ROUTE_HPP

#include <string>
#include <vector>

namespace SimpleVfsd {

// A route is an ordered list of segments. The first segment names a
// partition, the rest is a path relative to that partition's root.
using Route = std::vector<std::string>;

// Render a route as "partition/seg/seg" for messages and CLI output
std::string routeToString(const Route& route);

// Split "partition/seg/seg" into a route, dropping empty segments
Route parseRoute(const std::string& text);

// Returns a copy of parent with name appended
Route childRoute(const Route& parent, const std::string& name);

} // namespace SimpleVfsd

#endif // SIMPLE_VFSD_ROUTE_HPP

#include "simple_vfsd/vfs_error.hpp"

namespace SimpleVfsd {

RouteError::RouteError(const Route& route)
    : VfsError(route.empty() ? std::string("Empty route")
                             : "Unknown partition '" + route.front() + "' in route " + routeToString(route),
               route) {}

ReadError::ReadError(const Route& route, const std::string& path, const std::string& reason)
    : VfsError("Failed to read " + routeToString(route) + " (" + path + "): " + reason, route),
      path_(path) {}

UnsupportedTypeError::UnsupportedTypeError(const Route& route, const std::string& path)
    : VfsError("Unsupported file type at " + routeToString(route) + " (" + path + ")", route),
      path_(path) {}

UnsupportedOperationError::UnsupportedOperationError(const std::string& operation, const Route& route)
    : VfsError("Operation '" + operation + "' is not supported (route " + routeToString(route) + ")", route) {}

} // namespace SimpleVfsd

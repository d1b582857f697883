/**
 * @file vfs_error.hpp
 * @brief Error types raised by the virtual filesystem
 * @author SimpleDaemons
 * @copyright 2024 SimpleDaemons
 * @license Apache-2.0
 */

#ifndef SIMPLE_VFSD_VFS_ERROR_HPP
#define SIMPLE_VFSD_VFS_ERROR_HPP

#include "simple_vfsd/route.hpp"
#include <stdexcept>
#include <string>

namespace SimpleVfsd {

// Base class for every failure reported by Vfs operations
class VfsError : public std::runtime_error {
public:
    VfsError(const std::string& message, const Route& route)
        : std::runtime_error(message), route_(route) {}

    const Route& route() const { return route_; }

private:
    Route route_;
};

// Route is empty or its first segment is not a registered partition
class RouteError : public VfsError {
public:
    explicit RouteError(const Route& route);
};

// Underlying I/O failure (missing entry, permission denied, invalid text)
class ReadError : public VfsError {
public:
    ReadError(const Route& route, const std::string& path, const std::string& reason);

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

// Entry is neither a regular file nor a directory
class UnsupportedTypeError : public VfsError {
public:
    UnsupportedTypeError(const Route& route, const std::string& path);

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

// Operation exists in the interface but is not implemented
class UnsupportedOperationError : public VfsError {
public:
    UnsupportedOperationError(const std::string& operation, const Route& route);
};

} // namespace SimpleVfsd

#endif // SIMPLE_VFSD_VFS_ERROR_HPP

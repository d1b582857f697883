/**
 * @file tree_reader.cpp
 * @brief Recursive snapshot reader implementation
 * @author SimpleDaemons
 * @copyright 2024 SimpleDaemons
 * @license Apache-2.0
 */

#include "simple_vfsd/tree_reader.hpp"
#include "simple_vfsd/logger.hpp"
#include "simple_vfsd/vfs_error.hpp"
#include <cstdint>
#include <fstream>
#include <iterator>
#include <system_error>
#include <utility>

namespace SimpleVfsd {

TreeReader::TreeReader(const PartitionTable& partitions) : partitions_(partitions) {
}

VfsItem TreeReader::read(const Route& route, std::vector<SkippedEntry>* skipped) const {
    std::filesystem::path path = partitions_.resolve(route);
    return readPath(route, path, skipped, route.size() == 1);
}

VfsItem TreeReader::readPath(const Route& route, const std::filesystem::path& path,
                             std::vector<SkippedEntry>* skipped, bool follow_symlink) const {
    std::error_code ec;
    std::filesystem::file_status status = follow_symlink ? std::filesystem::status(path, ec)
                                                         : std::filesystem::symlink_status(path, ec);
    if (ec) {
        throw ReadError(route, path.string(), ec.message());
    }

    switch (status.type()) {
        case std::filesystem::file_type::directory:
            return readDirectory(route, path, skipped);
        case std::filesystem::file_type::regular:
            return readFile(route, path);
        case std::filesystem::file_type::not_found:
            throw ReadError(route, path.string(), "No such file or directory");
        default:
            throw UnsupportedTypeError(route, path.string());
    }
}

VfsItem TreeReader::readDirectory(const Route& route, const std::filesystem::path& path,
                                  std::vector<SkippedEntry>* skipped) const {
    std::error_code ec;
    std::filesystem::directory_iterator it(path, ec);
    if (ec) {
        throw ReadError(route, path.string(), ec.message());
    }

    VfsDir dir;
    dir.route = route;

    for (std::filesystem::directory_iterator end; it != end; it.increment(ec)) {
        std::string name = it->path().filename().string();
        Route child_route = childRoute(route, name);

        try {
            dir.children.emplace(name, readPath(child_route, it->path(), skipped));
        } catch (const VfsError& e) {
            Logger::debug(std::string("Skipping child: ") + e.what());
            if (skipped) {
                skipped->push_back(SkippedEntry{child_route, e.what()});
            }
        }
    }

    // Enumeration itself failing is a failure of this directory
    if (ec) {
        throw ReadError(route, path.string(), ec.message());
    }

    return VfsItem(std::move(dir));
}

VfsItem TreeReader::readFile(const Route& route, const std::filesystem::path& path) const {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw ReadError(route, path.string(), "Unable to open file");
    }

    std::string contents((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw ReadError(route, path.string(), "I/O error while reading");
    }

    if (!isValidUtf8(contents)) {
        throw ReadError(route, path.string(), "Contents are not valid UTF-8 text");
    }

    return VfsItem(VfsFile{route, std::move(contents)});
}

bool isValidUtf8(const std::string& data) {
    size_t i = 0;
    const size_t n = data.size();

    while (i < n) {
        unsigned char c = static_cast<unsigned char>(data[i]);
        size_t extra;
        uint32_t code_point;

        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            extra = 1;
            code_point = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            extra = 2;
            code_point = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            extra = 3;
            code_point = c & 0x07;
        } else {
            return false;
        }

        if (i + extra >= n) {
            return false;
        }

        for (size_t k = 1; k <= extra; ++k) {
            unsigned char cc = static_cast<unsigned char>(data[i + k]);
            if ((cc & 0xC0) != 0x80) {
                return false;
            }
            code_point = (code_point << 6) | (cc & 0x3F);
        }

        // Overlong encodings, surrogates and out-of-range values
        if ((extra == 1 && code_point < 0x80) ||
            (extra == 2 && code_point < 0x800) ||
            (extra == 3 && code_point < 0x10000) ||
            (code_point >= 0xD800 && code_point <= 0xDFFF) ||
            code_point > 0x10FFFF) {
            return false;
        }

        i += extra + 1;
    }

    return true;
}

} // namespace SimpleVfsd

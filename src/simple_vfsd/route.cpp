#include "simple_vfsd/route.hpp"
#include <sstream>

namespace SimpleVfsd {

std::string routeToString(const Route& route) {
    std::string result;
    for (size_t i = 0; i < route.size(); ++i) {
        if (i > 0) {
            result += '/';
        }
        result += route[i];
    }
    return result;
}

Route parseRoute(const std::string& text) {
    Route route;
    std::stringstream ss(text);
    std::string segment;

    while (std::getline(ss, segment, '/')) {
        if (!segment.empty()) {
            route.push_back(segment);
        }
    }

    return route;
}

Route childRoute(const Route& parent, const std::string& name) {
    Route child = parent;
    child.push_back(name);
    return child;
}

} // namespace SimpleVfsd

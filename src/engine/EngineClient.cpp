#include "engine/EngineClient.hpp"

#include <algorithm>

namespace kw::engine {

std::string normalizePath(const std::string& path) {
    std::string p = path;
    while (!p.empty() && p.front() == '/') p.erase(0, 1);
    if (p.starts_with("v1/")) p.erase(0, 3);
    return p;
}

bool TokenLookup::hasPolicy(const std::string& policy) const {
    return std::ranges::find(policies, policy) != policies.end();
}

}

/**
 * @file package_tracker.cpp
 * @brief Implementation of the installed-package record
 *
 * @date 2025
 */

#include "sandrun/core/package_tracker.hpp"

namespace sandrun {
namespace core {

std::vector<std::string> PackageTracker::Pending(const std::vector<std::string>& requested) const {
    std::vector<std::string> pending;
    std::set<std::string> seen;

    for (const auto& name : requested) {
        if (name.empty() || installed_.count(name) > 0) {
            continue;
        }
        if (seen.insert(name).second) {
            pending.push_back(name);
        }
    }

    return pending;
}

void PackageTracker::MarkInstalled(const std::vector<std::string>& packages) {
    for (const auto& name : packages) {
        if (!name.empty()) {
            installed_.insert(name);
        }
    }
}

std::vector<std::string> PackageTracker::Installed() const {
    return std::vector<std::string>(installed_.begin(), installed_.end());
}

} // namespace core
} // namespace sandrun

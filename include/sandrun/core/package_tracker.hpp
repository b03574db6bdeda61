/**
 * @file package_tracker.hpp
 * @brief Record of dependencies installed into the current environment
 *
 * A tracker belongs to exactly one environment generation. It only ever
 * contains names whose installation finished without a reported failure,
 * and it is discarded together with the environment.
 *
 * @date 2025
 */

#pragma once

#include <set>
#include <string>
#include <vector>

namespace sandrun {
namespace core {

/**
 * @class PackageTracker
 * @brief Set of installed package names with ordered difference queries
 *
 * **Usage Example**:
 * @code
 * PackageTracker tracker;
 * auto pending = tracker.Pending({"numpy", "pandas"});  // {"numpy", "pandas"}
 * // ... install succeeded ...
 * tracker.MarkInstalled(pending);
 * tracker.Pending({"numpy", "scipy"});                  // {"scipy"}
 * @endcode
 */
class PackageTracker {
public:
    /**
     * @brief Packages from the request that still need installing
     *
     * Preserves request order, skips empty names and repeated names.
     *
     * @param requested Package names from a request
     * @return Names not yet installed
     */
    std::vector<std::string> Pending(const std::vector<std::string>& requested) const;

    /**
     * @brief Record a successfully installed batch
     * @param packages Every name of the batch
     */
    void MarkInstalled(const std::vector<std::string>& packages);

    bool Contains(const std::string& name) const { return installed_.count(name) > 0; }
    std::size_t Size() const { return installed_.size(); }
    bool Empty() const { return installed_.empty(); }

    /// Installed names, sorted
    std::vector<std::string> Installed() const;

    /// Forget everything (new environment generation)
    void Clear() { installed_.clear(); }

private:
    std::set<std::string> installed_;
};

} // namespace core
} // namespace sandrun

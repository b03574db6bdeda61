/**
 * @file scope_exit.hpp
 * @brief Run an action when the enclosing scope is left
 *
 * The action runs on every exit path, including exceptions. It must not
 * throw.
 *
 * @date 2025
 */

#pragma once

#include <utility>

namespace sandrun {
namespace utils {

/**
 * @class ScopeExit
 * @brief RAII holder of a deferred action
 *
 * **Usage Example**:
 * @code
 * {
 *     ScopeExit teardown([&] { sandbox.Cleanup(); });
 *     RunRiskyWork();
 * }   // Cleanup() runs here, even if RunRiskyWork() threw
 * @endcode
 */
template <typename Action>
class ScopeExit {
public:
    explicit ScopeExit(Action action)
        : action_(std::move(action)) {}

    ~ScopeExit() {
        action_();
    }

    ScopeExit(const ScopeExit&) = delete;
    ScopeExit& operator=(const ScopeExit&) = delete;

private:
    Action action_;
};

} // namespace utils
} // namespace sandrun

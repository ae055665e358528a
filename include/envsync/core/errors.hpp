#pragma once

#include <stdexcept>
#include <string>

namespace envsync {

/**
 * @brief Raised when a configuration value is rejected at construction time
 *
 * Invalid strategy or direction labels, a worker count below one, empty roots
 * and exclusion patterns that do not compile all end up here. These are never
 * defaulted silently.
 */
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& what) : std::invalid_argument(what) {}
};

/**
 * @brief Raised by TaskPool::wait_for / wait_all when the deadline passes
 *
 * The task itself keeps running; its result is still stored when it finishes.
 */
class TaskTimeoutError : public std::runtime_error {
public:
    explicit TaskTimeoutError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace envsync

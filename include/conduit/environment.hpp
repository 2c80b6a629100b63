#pragma once

#include "conduit/utility.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace conduit {

/**
 * @brief Pass-through facade over the host process environment.
 *
 * Holds no state of its own; every call reads or writes the live environment,
 * so values set here are inherited by shell commands started afterwards.
 */
class Environment {
public:
    std::optional<std::string> get(const std::string &key) const;

    /**
     * @brief Reads a variable that must be present.
     * @return The value, or an `ErrorKind::environment` error naming the key.
     */
    Result<std::string> require(const std::string &key) const;

    /// True when the variable is set to "true" (case-insensitive) or "1".
    bool is_true(const std::string &key) const;

    Result<void> set(const std::string &key, const std::string &value);
    Result<void> unset(const std::string &key);
};

} // namespace conduit

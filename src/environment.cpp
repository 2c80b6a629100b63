#include "conduit/environment.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <format>

namespace conduit {

std::optional<std::string> Environment::get(const std::string &key) const {
    if (const char *value = std::getenv(key.c_str())) {
        return std::string(value);
    }
    return std::nullopt;
}

Result<std::string> Environment::require(const std::string &key) const {
    if (auto value = get(key)) {
        return *value;
    }
    return std::unexpected(Error::of(ErrorKind::environment, std::format("Missing environment variable: {}", key)));
}

bool Environment::is_true(const std::string &key) const {
    auto value = get(key);
    if (!value) {
        return false;
    }
    std::string lowered = *value;
    std::ranges::transform(lowered, lowered.begin(), [](unsigned char c) { return std::tolower(c); });
    return lowered == "true" || lowered == "1";
}

Result<void> Environment::set(const std::string &key, const std::string &value) {
    if (::setenv(key.c_str(), value.c_str(), 1) != 0) {
        return std::unexpected(
            Error::of(ErrorKind::environment, std::format("Failed to set {}: {}", key, std::strerror(errno))));
    }
    return {};
}

Result<void> Environment::unset(const std::string &key) {
    if (::unsetenv(key.c_str()) != 0) {
        return std::unexpected(
            Error::of(ErrorKind::environment, std::format("Failed to unset {}: {}", key, std::strerror(errno))));
    }
    return {};
}

} // namespace conduit

#include "conduit/secret.hpp"

#include "conduit/environment.hpp"

#include <format>
#include <fstream>
#include <iterator>

namespace conduit {

EnvironmentSecret::EnvironmentSecret(std::string key, Processor process_value)
    : key_(std::move(key)), process_value_(std::move(process_value)) {
}

EnvironmentSecret EnvironmentSecret::value(std::string key) {
    return {std::move(key), [](std::string &) -> Result<void> { return {}; }};
}

EnvironmentSecret EnvironmentSecret::base64_encoded_value(std::string key) {
    return {std::move(key), [](std::string &data) -> Result<void> {
                auto decoded = base64_decode(data);
                if (!decoded) {
                    return std::unexpected(Error::of(ErrorKind::decoding, "Failed to base64-decode secret"));
                }
                data = std::move(*decoded);
                return {};
            }};
}

Result<std::string> EnvironmentSecret::get() const {
    auto value = Environment{}.get(key_);
    if (!value) {
        return std::unexpected(
            Error::of(ErrorKind::missing_secret, std::format("Missing environment secret: {}", key_)));
    }

    std::string data = std::move(*value);
    if (process_value_) {
        if (auto res = process_value_(data); !res) {
            return std::unexpected(res.error());
        }
    }
    return data;
}

Result<std::string> FileSecret::get() const {
    std::ifstream file(path_, std::ios::binary);
    if (!file.is_open()) {
        return std::unexpected(
            Error::of(ErrorKind::missing_secret, std::format("Missing secret file: {}", path_.string())));
    }
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

} // namespace conduit

#pragma once

#include "conduit/utility.hpp"

#include <filesystem>
#include <functional>
#include <string>

namespace conduit {

/// Resolves a secret to its raw bytes.
class Secret {
public:
    virtual ~Secret() = default;
    virtual Result<std::string> get() const = 0;
};

/**
 * @brief Secret read from an environment variable, optionally post-processed
 * (e.g. base64-decoded) before being handed out.
 */
class EnvironmentSecret : public Secret {
public:
    using Processor = std::function<Result<void>(std::string &)>;

    EnvironmentSecret(std::string key, Processor process_value);

    static EnvironmentSecret value(std::string key);
    static EnvironmentSecret base64_encoded_value(std::string key);

    const std::string &key() const {
        return key_;
    }

    Result<std::string> get() const override;

private:
    std::string key_;
    Processor process_value_;
};

class FileSecret : public Secret {
public:
    explicit FileSecret(std::filesystem::path path) : path_(std::move(path)) {
    }

    Result<std::string> get() const override;

private:
    std::filesystem::path path_;
};

} // namespace conduit

#pragma once

#include "conduit/step.hpp"

#include <filesystem>
#include <string>

namespace conduit {

/**
 * @brief Creates a fresh directory under the system temp directory.
 *
 * The directory and everything in it are removed during cleanup.
 */
class TemporaryDirectoryStep : public BasicStep<std::filesystem::path> {
public:
    explicit TemporaryDirectoryStep(std::string prefix = "conduit") : prefix_(std::move(prefix)) {
    }

    std::string name() const override {
        return "Create temporary directory";
    }

    Result<std::filesystem::path> run() override;
    Result<void> cleanup(const std::optional<Error> &error) override;

    const std::filesystem::path &path() const {
        return path_;
    }

private:
    std::string prefix_;
    std::filesystem::path path_;
};

} // namespace conduit

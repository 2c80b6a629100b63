#pragma once

#include "conduit/step.hpp"

#include <optional>
#include <string>

namespace conduit {

/// Sets an environment variable for the rest of the run; cleanup puts back the previous value.
class ExportEnvironmentStep : public BasicStep<void> {
public:
    ExportEnvironmentStep(std::string key, std::string value) : key_(std::move(key)), value_(std::move(value)) {
    }

    std::string name() const override {
        return "Export " + key_;
    }

    Result<void> run() override;
    Result<void> cleanup(const std::optional<Error> &error) override;

private:
    std::string key_;
    std::string value_;
    std::optional<std::string> previous_;
    bool exported_ = false;
};

} // namespace conduit

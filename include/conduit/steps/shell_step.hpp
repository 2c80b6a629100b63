#pragma once

#include "conduit/shell.hpp"
#include "conduit/step.hpp"

#include <string>
#include <vector>

namespace conduit {

/// Runs one shell command; the output is the command's trimmed stdout.
class ShellStep : public BasicStep<std::string> {
public:
    ShellStep(std::string command, std::vector<std::string> args = {}, ShellOptions options = {})
        : command_(std::move(command)), args_(std::move(args)), options_(options) {
    }

    std::string name() const override {
        return Shell::command_line(command_, args_);
    }

    Result<std::string> run() override;

private:
    std::string command_;
    std::vector<std::string> args_;
    ShellOptions options_;
};

} // namespace conduit

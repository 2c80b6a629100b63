#pragma once

#include "conduit/utility.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace conduit {

class ExecutionContext;

struct ShellOptions {
    bool quiet = false; ///< Do not echo the command's output to stdout.
};

/**
 * @brief Runs shell commands in the context's current working directory.
 *
 * Every call logs the command line, runs it through `/bin/sh -c`, echoes
 * its output and returns stdout with trailing newlines removed. A non-zero
 * exit status is returned as an `ErrorKind::shell` error whose detail is the
 * command's stderr.
 */
class Shell {
public:
    explicit Shell(ExecutionContext &context) : context_(context) {
    }

    Result<std::string> operator()(std::string_view command,
                                   const std::vector<std::string> &args = {},
                                   ShellOptions options = {}) const;

    /// The exact `/bin/sh -c` payload `operator()` would run.
    static std::string command_line(std::string_view command, const std::vector<std::string> &args);

private:
    ExecutionContext &context_;
};

} // namespace conduit

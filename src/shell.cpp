#include "conduit/shell.hpp"

#include "conduit/context.hpp"
#include "conduit/process_exec.hpp"

#include <cstdio>
#include <format>
#include <print>

namespace conduit {

namespace {

void trim_trailing_newlines(std::string &s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) {
        s.pop_back();
    }
}

} // namespace

std::string Shell::command_line(std::string_view command, const std::vector<std::string> &args) {
    std::string line(command);
    for (const auto &arg : args) {
        line += ' ';
        line += shell_escape(arg);
    }
    return line;
}

Result<std::string> Shell::operator()(std::string_view command,
                                      const std::vector<std::string> &args,
                                      ShellOptions options) const {
    const std::string line = command_line(command, args);
    const std::string cwd = context_.working_directory().string();
    context_.logger().debug("Shell (at: {}): {}", cwd, line);

    auto launched = process_exec({"/bin/sh", "-c", line}, cwd);
    if (!launched) {
        return std::unexpected(launched.error());
    }

    ProcessOutput output = launched->get();
    if (output.ec) {
        return std::unexpected(
            Error::of(ErrorKind::shell, std::format("Failed to run `{}`: {}", line, output.ec.message())));
    }

    if (!options.quiet && !output.out.empty()) {
        std::print("{}", output.out);
        std::fflush(stdout);
    }

    if (output.status != 0) {
        trim_trailing_newlines(output.err);
        return std::unexpected(Error::of(
            ErrorKind::shell, std::format("Command `{}` failed with exit code {}", line, output.status), output.err));
    }

    trim_trailing_newlines(output.out);
    return output.out;
}

} // namespace conduit

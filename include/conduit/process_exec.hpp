#pragma once

#include "conduit/utility.hpp"

#include <future>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace conduit {

struct ProcessOutput {
    int status = -1;
    std::string out;
    std::string err;
    std::error_code ec; ///< Set when the process could not be started or drained.
};

/**
 * @brief Executes a subprocess, capturing its standard output and error.
 *
 * @param args The command line arguments (first argument is the executable).
 * @param working_dir Optional working directory for the subprocess.
 * @return A future resolving to the exit status and captured streams.
 */
Result<std::future<ProcessOutput>> process_exec(std::vector<std::string> &&args,
                                                std::optional<std::string> working_dir = std::nullopt);
} // namespace conduit

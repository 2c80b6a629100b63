#pragma once

#include "conduit/context.hpp"
#include "conduit/utility.hpp"
#include "conduit/workflow.hpp"

#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace conduit {

struct RunnerConfig {
    std::optional<std::filesystem::path> workspace = std::nullopt;
    bool show_help = false;
    bool show_version = false;
};

/**
 * @brief Parses the pipeline's command line (arguments after the program name).
 * @return The parsed options, or an `ErrorKind::invalid_argument` error.
 */
Result<RunnerConfig> parse_arguments(std::span<const std::string_view> args);

/**
 * @brief Resolves the directory the pipeline runs in.
 *
 * A detected CI platform supplies the workspace; otherwise `--workspace` is
 * required.
 */
Result<std::filesystem::path> resolve_workspace(Platform &platform, const RunnerConfig &config);

/**
 * @brief Runs `root` as the top-level workflow.
 *
 * Configures the logger from `root.log_level()`, changes into the workspace,
 * runs the root, then always drains the cleanup stack with the terminal
 * error before returning.
 *
 * @return The process exit status: 0 on success, 1 on any failure.
 */
int run_main(Workflow &root, std::span<const std::string_view> args, ExecutionContext &context);

/// `int main(int argc, char **argv) { return conduit::main<MyWorkflow>(argc, argv); }`
template <typename W>
int main(int argc, const char *const *argv) {
    std::vector<std::string_view> args(argv + (argc > 0 ? 1 : 0), argv + argc);
    W root;
    return run_main(root, args, ExecutionContext::current());
}

} // namespace conduit

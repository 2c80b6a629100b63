#include "conduit/platform.hpp"

#include <cstdio>
#include <format>
#include <print>

namespace conduit {

bool GitHubPlatform::detect(const Environment &env) {
    return env.is_true("GITHUB_ACTIONS");
}

bool GitHubPlatform::is_running_ci() const {
    return env_.is_true("CI");
}

Result<std::filesystem::path> GitHubPlatform::workspace() const {
    auto workspace = env_.require("GITHUB_WORKSPACE");
    if (!workspace) {
        return std::unexpected(workspace.error());
    }
    std::filesystem::path path(*workspace);
    if (!path.is_absolute()) {
        return std::unexpected(
            Error::of(ErrorKind::environment, std::format("GITHUB_WORKSPACE is not an absolute path: {}", *workspace)));
    }
    return path;
}

void GitHubPlatform::start_log_group(std::string_view group) {
    if (!is_running_ci())
        return;
    std::println("::group::{}", group);
    std::fflush(stdout);
}

void GitHubPlatform::end_log_group(std::string_view) {
    if (!is_running_ci())
        return;
    std::println("::endgroup::");
    std::fflush(stdout);
}

Result<std::filesystem::path> LocalPlatform::workspace() const {
    return std::unexpected(Error::of(ErrorKind::invalid_argument,
                                     "Not running in CI: the workspace must be provided with --workspace <path>"));
}

std::unique_ptr<Platform> detect_platform(const Environment &env) {
    if (GitHubPlatform::detect(env)) {
        return std::make_unique<GitHubPlatform>(env);
    }
    return std::make_unique<LocalPlatform>();
}

} // namespace conduit

#pragma once

#include "conduit/environment.hpp"
#include "conduit/utility.hpp"

#include <filesystem>
#include <memory>
#include <string_view>

namespace conduit {

/**
 * @brief The CI service (or lack of one) the pipeline is running under.
 *
 * Supplies the workspace root when running in CI and, where the service
 * supports it, folds log output into collapsible groups.
 */
class Platform {
public:
    virtual ~Platform() = default;

    virtual std::string_view name() const = 0;
    virtual bool is_running_ci() const = 0;
    virtual Result<std::filesystem::path> workspace() const = 0;

    virtual bool supports_log_groups() const {
        return false;
    }
    virtual void start_log_group(std::string_view) {
    }
    virtual void end_log_group(std::string_view) {
    }
};

class GitHubPlatform : public Platform {
public:
    explicit GitHubPlatform(const Environment &env) : env_(env) {
    }

    /// GitHub Actions exports GITHUB_ACTIONS=true on its runners.
    static bool detect(const Environment &env);

    std::string_view name() const override {
        return "GitHub Actions";
    }
    bool is_running_ci() const override;
    Result<std::filesystem::path> workspace() const override;

    // https://docs.github.com/en/actions/using-workflows/workflow-commands-for-github-actions#grouping-log-lines
    bool supports_log_groups() const override {
        return true;
    }
    void start_log_group(std::string_view group) override;
    void end_log_group(std::string_view group) override;

private:
    const Environment &env_;
};

class LocalPlatform : public Platform {
public:
    std::string_view name() const override {
        return "Local";
    }
    bool is_running_ci() const override {
        return false;
    }
    Result<std::filesystem::path> workspace() const override;
};

std::unique_ptr<Platform> detect_platform(const Environment &env);

} // namespace conduit

#pragma once

#include "conduit/cleanup_stack.hpp"
#include "conduit/environment.hpp"
#include "conduit/logging.hpp"
#include "conduit/platform.hpp"
#include "conduit/shell.hpp"
#include "conduit/utility.hpp"

#include <filesystem>
#include <functional>
#include <memory>
#include <string>

namespace conduit {

class Secret;
class Step;
class Workflow;

/**
 * @brief Opens a platform log group on construction and closes it on
 * destruction. A no-op on platforms without log groups.
 */
class LogGroup {
public:
    LogGroup(Platform &platform, std::string name);
    ~LogGroup();

    LogGroup(const LogGroup &) = delete;
    LogGroup &operator=(const LogGroup &) = delete;

private:
    Platform &platform_;
    std::string name_;
};

/**
 * @brief Ambient state shared by every workflow and step of a run.
 *
 * One context is "current" per thread: the one installed by the innermost
 * live `ContextScope`, or a process-wide default when none is. Tests build
 * their own context (usually with a capturing logger and a recording
 * sleeper) and install it with a `ContextScope`.
 *
 * The working directory is the real process directory; changing it is
 * visible to every subsequent shell command.
 */
class ExecutionContext {
public:
    using Sleeper = std::function<void(Seconds)>;

    ExecutionContext();
    explicit ExecutionContext(std::shared_ptr<spdlog::logger> logger);

    ExecutionContext(const ExecutionContext &) = delete;
    ExecutionContext &operator=(const ExecutionContext &) = delete;

    static ExecutionContext &current();

    spdlog::logger &logger() const {
        return *logger_;
    }
    void set_log_level(LogLevel level);

    std::filesystem::path working_directory() const;
    Result<void> change_directory(const std::filesystem::path &path);

    CleanupStack &cleanup_stack() {
        return cleanup_stack_;
    }

    // Diagnostics only; never owning.
    const Step *current_step() const {
        return current_step_;
    }
    void set_current_step(const Step *step) {
        current_step_ = step;
    }
    const Workflow *current_workflow() const {
        return current_workflow_;
    }
    void set_current_workflow(const Workflow *workflow) {
        current_workflow_ = workflow;
    }

    Environment &environment() {
        return environment_;
    }
    const Shell &shell() const {
        return shell_;
    }

    Platform &platform() {
        return *platform_;
    }
    void set_platform(std::unique_ptr<Platform> platform) {
        platform_ = std::move(platform);
    }

    Result<std::string> load_secret(const Secret &secret) const;

    /// Blocks for `delay` using the installed sleeper.
    void sleep(Seconds delay) const;
    void set_sleeper(Sleeper sleeper) {
        sleeper_ = std::move(sleeper);
    }

    LogGroup log_group(std::string name) {
        return LogGroup(*platform_, std::move(name));
    }

private:
    std::shared_ptr<spdlog::logger> logger_;
    CleanupStack cleanup_stack_;
    Environment environment_;
    Shell shell_{*this};
    std::unique_ptr<Platform> platform_;
    Sleeper sleeper_;
    const Step *current_step_ = nullptr;
    const Workflow *current_workflow_ = nullptr;
};

/// Installs a context as current for this thread until destroyed.
class ContextScope {
public:
    explicit ContextScope(ExecutionContext &context);
    ~ContextScope();

    ContextScope(const ContextScope &) = delete;
    ContextScope &operator=(const ContextScope &) = delete;

private:
    ExecutionContext *previous_;
};

} // namespace conduit

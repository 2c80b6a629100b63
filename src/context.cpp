#include "conduit/context.hpp"

#include "conduit/secret.hpp"

#include <format>
#include <thread>

namespace conduit {

namespace {

thread_local ExecutionContext *installed = nullptr;

} // namespace

LogGroup::LogGroup(Platform &platform, std::string name) : platform_(platform), name_(std::move(name)) {
    if (platform_.supports_log_groups())
        platform_.start_log_group(name_);
}

LogGroup::~LogGroup() {
    if (platform_.supports_log_groups())
        platform_.end_log_group(name_);
}

ExecutionContext::ExecutionContext() : ExecutionContext(make_logger()) {
}

ExecutionContext::ExecutionContext(std::shared_ptr<spdlog::logger> logger)
    : logger_(std::move(logger)), platform_(detect_platform(environment_)),
      sleeper_([](Seconds delay) { std::this_thread::sleep_for(delay); }) {
}

ExecutionContext &ExecutionContext::current() {
    if (installed) {
        return *installed;
    }
    static ExecutionContext process_context;
    return process_context;
}

void ExecutionContext::set_log_level(LogLevel level) {
    logger_->set_level(level);
}

std::filesystem::path ExecutionContext::working_directory() const {
    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    if (ec) {
        logger_->error("Failed to read current directory: {}", ec.message());
        return {};
    }
    return cwd;
}

Result<void> ExecutionContext::change_directory(const std::filesystem::path &path) {
    std::error_code ec;
    std::filesystem::current_path(path, ec);
    if (ec) {
        return std::unexpected(
            Error::step(std::format("Failed to change directory to {}: {}", path.string(), ec.message())));
    }
    return {};
}

Result<std::string> ExecutionContext::load_secret(const Secret &secret) const {
    return secret.get();
}

void ExecutionContext::sleep(Seconds delay) const {
    if (sleeper_) {
        sleeper_(delay);
    }
}

ContextScope::ContextScope(ExecutionContext &context) : previous_(installed) {
    installed = &context;
}

ContextScope::~ContextScope() {
    installed = previous_;
}

} // namespace conduit

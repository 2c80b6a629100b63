#include "conduit/steps/export_environment.hpp"

namespace conduit {

Result<void> ExportEnvironmentStep::run() {
    Environment &env = context().environment();
    previous_ = env.get(key_);
    if (auto res = env.set(key_, value_); !res) {
        return res;
    }
    exported_ = true;
    logger().info("{}={}", key_, value_);
    return {};
}

Result<void> ExportEnvironmentStep::cleanup(const std::optional<Error> &) {
    if (!exported_)
        return {};

    Environment &env = context().environment();
    if (previous_) {
        return env.set(key_, *previous_);
    }
    return env.unset(key_);
}

} // namespace conduit

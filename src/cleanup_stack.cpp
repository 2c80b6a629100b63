#include "conduit/cleanup_stack.hpp"

#include "conduit/step.hpp"

#include <exception>
#include <spdlog/logger.h>

namespace conduit {

void CleanupStack::push(std::shared_ptr<Step> step) {
    steps_.push_back(std::move(step));
}

size_t CleanupStack::unwind(const std::optional<Error> &error, spdlog::logger &logger) {
    size_t failures = 0;
    while (!steps_.empty()) {
        std::shared_ptr<Step> step = std::move(steps_.back());
        steps_.pop_back();

        logger.debug("Cleaning up step: {}", step->name());
        try {
            if (auto res = step->cleanup(error); !res) {
                ++failures;
                logger.error("Cleanup failed for step {}: {}", step->name(), describe(res.error()));
            }
        } catch (const std::exception &err) {
            ++failures;
            logger.error("Cleanup failed for step {}: {}", step->name(), err.what());
        }
    }
    return failures;
}

} // namespace conduit

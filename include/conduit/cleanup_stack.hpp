#pragma once

#include "conduit/utility.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

namespace spdlog {
class logger;
}

namespace conduit {

class Step;

/**
 * @brief LIFO registry of steps that have started running.
 *
 * Steps are pushed as they start and popped during unwind, so the innermost
 * and most recent work is cleaned up first. Each pushed step is cleaned up
 * exactly once.
 */
class CleanupStack {
public:
    void push(std::shared_ptr<Step> step);

    size_t size() const {
        return steps_.size();
    }
    bool empty() const {
        return steps_.empty();
    }

    /**
     * @brief Pops every step and invokes its cleanup.
     *
     * @param error The terminal error of the run, or nullopt if it succeeded.
     * @param logger Receives a message for each cleanup that fails; a failing
     *               cleanup never stops the remaining ones.
     * @return The number of cleanups that failed.
     */
    size_t unwind(const std::optional<Error> &error, spdlog::logger &logger);

private:
    std::vector<std::shared_ptr<Step>> steps_;
};

} // namespace conduit

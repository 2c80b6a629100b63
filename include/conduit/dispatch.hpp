#pragma once

#include "conduit/context.hpp"
#include "conduit/utility.hpp"

#include <concepts>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

namespace conduit {

class Step;
class Workflow;

namespace detail {

/// Clears the context's current step when a step call returns or throws.
class CurrentStepScope {
public:
    CurrentStepScope(ExecutionContext &context, const Step *step) : context_(context) {
        context_.set_current_step(step);
    }
    ~CurrentStepScope() {
        context_.set_current_step(nullptr);
    }

    CurrentStepScope(const CurrentStepScope &) = delete;
    CurrentStepScope &operator=(const CurrentStepScope &) = delete;

private:
    ExecutionContext &context_;
};

} // namespace detail

/**
 * @brief Runs a step in the current context.
 *
 * The step is registered on the cleanup stack before it runs, so its cleanup
 * is scheduled even if `run` fails. Cleanup itself is deferred to the unwind
 * at the end of the whole run. The result of `run` is returned unchanged.
 *
 * @param step The step to run; kept alive by the cleanup stack until unwind.
 * @param name Display name overriding `step->name()`.
 */
template <typename S>
    requires std::derived_from<S, Step>
Result<typename S::Output> run_step(std::shared_ptr<S> step, std::optional<std::string> name = std::nullopt) {
    ExecutionContext &context = ExecutionContext::current();
    context.cleanup_stack().push(step);
    detail::CurrentStepScope scope(context, step.get());
    context.logger().info("Step: {}", name ? *name : step->name());
    return step->run();
}

template <typename S>
    requires std::derived_from<std::remove_cvref_t<S>, Step>
Result<typename std::remove_cvref_t<S>::Output> run_step(S &&step, std::optional<std::string> name = std::nullopt) {
    return run_step(std::make_shared<std::remove_cvref_t<S>>(std::forward<S>(step)), std::move(name));
}

/**
 * @brief Runs a child workflow in the current context.
 *
 * The working directory is restored to its value on entry once the child
 * returns, whether it succeeded or not. Workflows are not registered for
 * cleanup.
 */
Result<void> run_workflow(Workflow &child);
Result<void> run_workflow(Workflow &&child);

/**
 * @brief Authoring helpers shared by workflows and steps.
 */
class StepRunner {
protected:
    ExecutionContext &context() const {
        return ExecutionContext::current();
    }
    spdlog::logger &logger() const {
        return context().logger();
    }

    template <typename S>
    auto step(S &&unit, std::optional<std::string> name = std::nullopt) {
        return run_step(std::forward<S>(unit), std::move(name));
    }

    template <typename W>
    Result<void> workflow(W &&child) {
        return run_workflow(std::forward<W>(child));
    }
};

} // namespace conduit

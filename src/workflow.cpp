#include "conduit/workflow.hpp"

#include "conduit/context.hpp"

#include <exception>
#include <filesystem>

namespace conduit {

namespace {

/// Restores the working directory and current workflow on scope exit.
class WorkflowScope {
public:
    WorkflowScope(ExecutionContext &context, const Workflow &child)
        : context_(context), directory_(context.working_directory()), previous_(context.current_workflow()) {
        context_.set_current_workflow(&child);
    }

    ~WorkflowScope() {
        context_.set_current_workflow(previous_);
        if (directory_.empty())
            return;
        if (auto res = context_.change_directory(directory_); !res) {
            context_.logger().error("Failed to restore working directory: {}", describe(res.error()));
        }
    }

    WorkflowScope(const WorkflowScope &) = delete;
    WorkflowScope &operator=(const WorkflowScope &) = delete;

private:
    ExecutionContext &context_;
    std::filesystem::path directory_;
    const Workflow *previous_;
};

} // namespace

Result<void> run_workflow(Workflow &child) {
    ExecutionContext &context = ExecutionContext::current();
    WorkflowScope scope(context, child);
    context.logger().info("Workflow: {}", child.name());
    return child.run();
}

Result<void> run_workflow(Workflow &&child) {
    return run_workflow(child);
}

} // namespace conduit

#include "conduit/runner.hpp"

#include <exception>
#include <format>
#include <print>

namespace conduit {

namespace {

void print_help(std::string_view workflow) {
    std::println("Usage: {} [options]", workflow);
    std::println("Options:");
    std::println("  -h, --help              Show this help message");
    std::println("  -v, --version           Show version");
    std::println("  --workspace <path>      The root directory of the package (required outside CI)");
}

void print_version() {
    std::println("conduit {}", CONDUIT_PROJ_VER);
}

Result<void> set_up_workspace(ExecutionContext &context, const RunnerConfig &config) {
    auto workspace = resolve_workspace(context.platform(), config);
    if (!workspace) {
        return std::unexpected(workspace.error());
    }

    context.logger().debug("Setting current directory: {}", workspace->string());
    if (auto res = context.change_directory(*workspace); !res) {
        return std::unexpected(Error::internal(std::format("Failed to set current directory: {}", res.error().message)));
    }
    return {};
}

Result<void> run_root(Workflow &root) {
    try {
        return root.run();
    } catch (const std::exception &err) {
        return std::unexpected(Error::step(err.what()));
    } catch (...) {
        return std::unexpected(Error::step("Unknown exception"));
    }
}

} // namespace

Result<RunnerConfig> parse_arguments(std::span<const std::string_view> args) {
    RunnerConfig config;
    constexpr std::string_view workspace_eq = "--workspace=";

    for (size_t i = 0; i < args.size(); ++i) {
        std::string_view arg = args[i];
        if (arg == "-h" || arg == "--help") {
            config.show_help = true;
        } else if (arg == "-v" || arg == "--version") {
            config.show_version = true;
        } else if (arg == "--workspace") {
            if (i + 1 < args.size()) {
                config.workspace = std::filesystem::path(args[i + 1]);
                i++;
            } else {
                return std::unexpected(Error::of(ErrorKind::invalid_argument, "Missing argument for --workspace"));
            }
        } else if (arg.starts_with(workspace_eq)) {
            arg.remove_prefix(workspace_eq.size());
            if (arg.empty()) {
                return std::unexpected(Error::of(ErrorKind::invalid_argument, "Missing argument for --workspace"));
            }
            config.workspace = std::filesystem::path(arg);
        } else {
            return std::unexpected(Error::of(ErrorKind::invalid_argument, std::format("Unknown argument: {}", arg)));
        }
    }
    return config;
}

Result<std::filesystem::path> resolve_workspace(Platform &platform, const RunnerConfig &config) {
    if (platform.is_running_ci()) {
        return platform.workspace();
    }
    if (!config.workspace) {
        return std::unexpected(
            Error::of(ErrorKind::invalid_argument, "Missing required option: --workspace <path>"));
    }
    return *config.workspace;
}

int run_main(Workflow &root, std::span<const std::string_view> args, ExecutionContext &context) {
    ContextScope scope(context);

    context.set_log_level(root.log_level());
    context.logger().info("Starting Workflow: {}", root.name());

    auto config = parse_arguments(args);
    if (config && config->show_help) {
        print_help(root.name());
        return 0;
    }
    if (config && config->show_version) {
        print_version();
        return 0;
    }

    std::optional<Error> failure;
    if (!config) {
        failure = config.error();
    } else if (auto res = set_up_workspace(context, *config); !res) {
        failure = res.error();
    } else {
        context.set_current_workflow(&root);
        if (auto run = run_root(root); !run) {
            failure = run.error();
        }
        context.set_current_workflow(nullptr);
    }

    context.cleanup_stack().unwind(failure, context.logger());

    if (failure) {
        context.logger().error("Exiting on error:\n{}", describe(*failure));
        context.logger().flush();
        return 1;
    }
    context.logger().flush();
    return 0;
}

} // namespace conduit

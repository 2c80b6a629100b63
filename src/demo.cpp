#include "conduit/conduit.hpp"

#include <filesystem>
#include <fstream>

namespace {

using conduit::Result;

/// Counts the files a build left in a scratch directory.
class CountArtifacts : public conduit::BasicStep<size_t> {
public:
    explicit CountArtifacts(std::filesystem::path dir) : dir_(std::move(dir)) {
    }

    Result<size_t> run() override {
        std::error_code ec;
        size_t count = 0;
        for (auto it = std::filesystem::directory_iterator(dir_, ec); !ec && it != std::filesystem::directory_iterator();
             it.increment(ec)) {
            ++count;
        }
        if (ec) {
            return std::unexpected(conduit::Error::step("Failed to list " + dir_.string(), ec.message()));
        }
        return count;
    }

private:
    std::filesystem::path dir_;
};

class Build : public conduit::Workflow {
public:
    Result<void> run() override {
        auto scratch = step(conduit::TemporaryDirectoryStep("conduit-demo"));
        if (!scratch)
            return std::unexpected(scratch.error());

        if (auto res = context().change_directory(*scratch); !res)
            return res;

        {
            auto group = context().log_group("Compile");
            std::ofstream(*scratch / "main.o") << "object";
            if (auto res = step(conduit::ShellStep("ls", {"-1"})); !res)
                return std::unexpected(res.error());
        }

        auto artifacts = step(CountArtifacts(*scratch), "Count artifacts");
        if (!artifacts)
            return std::unexpected(artifacts.error());
        logger().info("Build produced {} artifact(s)", *artifacts);
        return {};
    }
};

class Test : public conduit::Workflow {
public:
    Result<void> run() override {
        if (auto res = step(conduit::ExportEnvironmentStep("CONDUIT_DEMO_STAGE", "test")); !res)
            return res;

        auto output = step(conduit::ShellStep("echo \"stage: $CONDUIT_DEMO_STAGE\""));
        if (!output)
            return std::unexpected(output.error());
        logger().info("Output: {}", *output);
        return {};
    }
};

class Demo : public conduit::Workflow {
public:
    conduit::LogLevel log_level() const override {
        return conduit::LogLevel::debug;
    }

    Result<void> run() override {
        if (auto res = workflow(Build{}); !res)
            return res;
        return workflow(Test{});
    }
};

} // namespace

int main(const int argc, const char *const *argv) {
    return conduit::main<Demo>(argc, argv);
}

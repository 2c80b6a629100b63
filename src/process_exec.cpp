#include "conduit/process_exec.hpp"

#include "conduit/utility.hpp"

#include <expected>
#include <future>
#include <optional>
#include <reproc++/drain.hpp>
#include <reproc++/run.hpp>
#include <string>
#include <utility>
#include <vector>

namespace conduit {
Result<std::future<ProcessOutput>> process_exec(std::vector<std::string> &&args,
                                                std::optional<std::string> working_dir) {
    if (args.empty()) {
        return std::unexpected(Error::of(ErrorKind::shell, "Cannot execute empty command"));
    }

    return std::async(std::launch::async, [args = std::move(args), working_dir]() -> ProcessOutput {
        reproc::options options;

        if (working_dir) {
            options.working_directory = working_dir->c_str();
        }

        ProcessOutput output;
        reproc::sink::string out_sink(output.out);
        reproc::sink::string err_sink(output.err);

        auto [status, ec] = reproc::run(args, options, out_sink, err_sink);

        output.status = ec ? -1 : status;
        output.ec = ec;
        return output;
    });
}
} // namespace conduit

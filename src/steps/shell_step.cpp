#include "conduit/steps/shell_step.hpp"

namespace conduit {

Result<std::string> ShellStep::run() {
    return context().shell()(command_, args_, options_);
}

} // namespace conduit

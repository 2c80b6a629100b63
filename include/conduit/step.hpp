#pragma once

#include "conduit/dispatch.hpp"
#include "conduit/utility.hpp"

#include <optional>
#include <string>

namespace conduit {

/**
 * @brief A unit of work with optional cleanup.
 *
 * `cleanup` runs during the unwind that follows the whole run, in reverse
 * order of step registration, and receives the run's terminal error (nullopt
 * on success). A failing cleanup is logged and does not stop the others.
 */
class Step : public StepRunner {
public:
    virtual ~Step() = default;

    /// Display name; defaults to the step's type name.
    virtual std::string name() const {
        return type_name(typeid(*this));
    }

    virtual Result<void> cleanup(const std::optional<Error> &) {
        return {};
    }
};

template <typename Out>
class BasicStep : public Step {
public:
    using Output = Out;

    virtual Result<Output> run() = 0;
};

} // namespace conduit

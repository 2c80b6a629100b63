#pragma once

#include "conduit/dispatch.hpp"
#include "conduit/logging.hpp"
#include "conduit/utility.hpp"

#include <string>

namespace conduit {

/**
 * @brief A named unit that sequences steps and nested workflows.
 *
 * The root workflow's `log_level` configures the pipeline logger once, at
 * startup. Levels declared by nested workflows are not applied.
 */
class Workflow : public StepRunner {
public:
    virtual ~Workflow() = default;

    virtual std::string name() const {
        return type_name(typeid(*this));
    }

    virtual LogLevel log_level() const {
        return LogLevel::info;
    }

    virtual Result<void> run() = 0;
};

} // namespace conduit

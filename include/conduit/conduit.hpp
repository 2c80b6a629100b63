#pragma once

#include "conduit/context.hpp"
#include "conduit/dispatch.hpp"
#include "conduit/environment.hpp"
#include "conduit/github_event.hpp"
#include "conduit/logging.hpp"
#include "conduit/platform.hpp"
#include "conduit/retry.hpp"
#include "conduit/runner.hpp"
#include "conduit/secret.hpp"
#include "conduit/shell.hpp"
#include "conduit/step.hpp"
#include "conduit/steps/export_environment.hpp"
#include "conduit/steps/shell_step.hpp"
#include "conduit/steps/temporary_directory.hpp"
#include "conduit/utility.hpp"
#include "conduit/workflow.hpp"

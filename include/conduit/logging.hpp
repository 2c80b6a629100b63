#pragma once

#include <memory>
#include <string>

#include <spdlog/logger.h>

namespace conduit {

using LogLevel = spdlog::level::level_enum;

/**
 * @brief Creates the default pipeline logger: a stderr color sink that is not
 * registered with spdlog's global registry.
 */
std::shared_ptr<spdlog::logger> make_logger(const std::string &name = "conduit");

} // namespace conduit

#include "conduit/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace conduit {

std::shared_ptr<spdlog::logger> make_logger(const std::string &name) {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
    logger->set_pattern("%^[%l]%$ %v");
    logger->set_level(spdlog::level::info);
    logger->flush_on(spdlog::level::err);
    return logger;
}

} // namespace conduit

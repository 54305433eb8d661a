#include "rpipe/core/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace rpipe {

Result<void> init_logging(const std::string& level) {
    const auto parsed = spdlog::level::from_str(level);
    // from_str falls back to "off" for names it does not know
    if (parsed == spdlog::level::off && level != "off") {
        return Err<void>(ErrorKind::InvalidConfig, "unknown log level: " + level);
    }

    auto logger = spdlog::get("rpipe");
    if (!logger) {
        logger = spdlog::stderr_color_mt("rpipe");
    }
    logger->set_pattern("[%H:%M:%S] [%^%l%$] %v");
    logger->set_level(parsed);
    logger->flush_on(spdlog::level::warn);

    spdlog::set_default_logger(logger);
    return Ok();
}

} // namespace rpipe

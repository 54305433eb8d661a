#pragma once

#include "rpipe/core/result.hpp"

#include <string>

namespace rpipe {

/**
 * @brief Install the process-wide spdlog logger
 *
 * All diagnostics go to stderr; stdout carries replayed stream data.
 * Accepts spdlog level names ("trace", "debug", "info", "warn", "error",
 * "critical", "off").
 */
Result<void> init_logging(const std::string& level);

} // namespace rpipe

#pragma once

#include "vdl/config.hpp"

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace vdl {

// All loggers write to stderr; stdout is reserved for the tool protocol.
// Configure levels from the [logging] section. Safe to call more than once.
void init_logging(const LoggingSettings& settings);

// Override the level of every vdl logger ("trace" ... "off")
void set_log_level(const std::string& level);

// Rejections, boundary escapes and legacy-path use.
// Silenced when logging.log_security_events is false.
std::shared_ptr<spdlog::logger> security_logger();

// Download start/finish records.
// Silenced when logging.log_downloads is false.
std::shared_ptr<spdlog::logger> download_logger();

} // namespace vdl

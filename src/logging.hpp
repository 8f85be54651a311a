// src/logging.hpp
// Library logger.

#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace stitch {
namespace logging {

static constexpr const char* LOGGER_NAME = "stitch";

// spdlog level for a STITCH_LOG_LEVEL value. Unknown names fall back to warn
// instead of silencing the logger.
spdlog::level::level_enum parse_level(const std::string& name);

// The "stitch" logger. Reuses a logger the application registered under that
// name, otherwise creates a colored stdout logger configured from
// STITCH_LOG_LEVEL (default "warn") and STITCH_LOG_PATTERN.
std::shared_ptr<spdlog::logger> get();

} // namespace logging
} // namespace stitch

// src/logging.cpp

#include "logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <mutex>
#include <string>

namespace stitch {
namespace logging {

namespace {

std::string resolve_level() {
    if (const char* level = std::getenv("STITCH_LOG_LEVEL")) {
        return level;
    }
    return "warn";
}

std::string resolve_pattern() {
    if (const char* pattern = std::getenv("STITCH_LOG_PATTERN")) {
        return pattern;
    }
    return "%Y-%m-%dT%H:%M:%S.%e%z [%n] [%^%l%$] %v";
}

} // namespace

spdlog::level::level_enum parse_level(const std::string& name) {
    auto level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && name != "off") {
        return spdlog::level::warn;
    }
    return level;
}

std::shared_ptr<spdlog::logger> get() {
    static std::mutex mutex;
    std::lock_guard<std::mutex> lock(mutex);

    if (auto existing = spdlog::get(LOGGER_NAME)) {
        return existing;
    }
    auto logger = spdlog::stdout_color_mt(LOGGER_NAME);
    logger->set_pattern(resolve_pattern());
    logger->set_level(parse_level(resolve_level()));
    logger->flush_on(spdlog::level::warn);
    return logger;
}

} // namespace logging
} // namespace stitch

#pragma once

#include <memory>
#include <string>

namespace spdlog {
class logger;
}

namespace artboard_log {

struct LogSettings {
    std::string level = "info"; // trace, debug, info, warn, error, critical, off
    std::string file;           // empty = stderr; relative paths land under logs/
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] %v";
};

// Shared "artboard" logger. Lazily created on first use with a stderr sink.
std::shared_ptr<spdlog::logger> logger();

// Replaces the shared logger according to settings. Falls back to spdlog's default
// logger when the sink cannot be created.
void configure(const LogSettings& settings);

} // namespace artboard_log

#include <artboard_log/logger.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <filesystem>

namespace artboard_log {

namespace {

const char* const logger_name = "artboard";

std::shared_ptr<spdlog::logger>& shared_logger() {
    static std::shared_ptr<spdlog::logger> logger;
    return logger;
}

std::filesystem::path resolve_log_path(const std::string& file) {
    std::filesystem::path p(file);
    if (p.is_relative() && !p.has_parent_path())
        p = std::filesystem::path("logs") / p;
    return p;
}

} // namespace

std::shared_ptr<spdlog::logger> logger() {
    auto& logger = shared_logger();
    if (logger) return logger;

    logger = spdlog::get(logger_name);
    if (logger) return logger;

    try {
        logger = spdlog::stderr_color_mt(logger_name);
        logger->set_level(spdlog::level::info);
    } catch (const spdlog::spdlog_ex&) {
        logger = spdlog::default_logger();
    }
    return logger;
}

void configure(const LogSettings& settings) {
    auto& logger = shared_logger();
    spdlog::drop(logger_name);
    logger.reset();

    try {
        if (settings.file.empty()) {
            logger = spdlog::stderr_color_mt(logger_name);
        } else {
            const std::filesystem::path log_file = resolve_log_path(settings.file);
            if (log_file.has_parent_path())
                std::filesystem::create_directories(log_file.parent_path());
            logger = spdlog::basic_logger_mt(logger_name, log_file.string(), true);
        }
        logger->set_level(spdlog::level::from_str(settings.level));
        logger->flush_on(spdlog::level::info);
        logger->set_pattern(settings.pattern);
        if (!settings.file.empty())
            logger->info("Logger initialized. file={}", resolve_log_path(settings.file).string());
    } catch (const spdlog::spdlog_ex&) {
        logger = spdlog::default_logger();
    } catch (const std::filesystem::filesystem_error& e) {
        logger = spdlog::default_logger();
        logger->warn("log directory unavailable ({}), logging to default sink", e.what());
    }
}

} // namespace artboard_log

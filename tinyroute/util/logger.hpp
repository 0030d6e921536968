#ifndef TINYROUTE_LOGGER_HPP
#define TINYROUTE_LOGGER_HPP
#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <string>
#include <memory>

namespace tinyroute {
    namespace logging {
        // Get/set the logger instance used by the library
        inline std::shared_ptr<spdlog::logger>& get_logger() {
            static std::shared_ptr<spdlog::logger> logger;
            return logger;
        }

        // Set a custom logger for the library
        inline void set_logger(std::shared_ptr<spdlog::logger> logger) {
            get_logger() = std::move(logger);
        }

        // Enable logging with default console logger
        inline void enable() {
            auto& logger = get_logger();
            if (!logger) {
                logger = spdlog::get("tinyroute");
                if (!logger) {
                    logger = spdlog::stdout_color_mt("tinyroute");
                }
                logger->set_level(spdlog::level::info);
                // Pattern: time [level:8] [thread_id] message
                logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%-8l%$] [%t] %v");
            }
        }

        // Set log level for the library logger
        inline void set_log_level(spdlog::level::level_enum level) {
            if (auto logger = get_logger()) {
                logger->set_level(level);
            }
        }

        // Disable logging completely
        inline void disable() {
            set_logger(nullptr);
        }
    }
}

// Internal macro, a no-op while no logger is installed
#define TINYROUTE_LOG_IMPL(level, ...) \
    do { \
        if (auto _logger = tinyroute::logging::get_logger()) { \
            _logger->log(level, __VA_ARGS__); \
        } \
    } while(0)

#define LOG_INFO(...)     TINYROUTE_LOG_IMPL(spdlog::level::info, __VA_ARGS__)
#define LOG_ERROR(...)    TINYROUTE_LOG_IMPL(spdlog::level::err, __VA_ARGS__)
#define LOG_WARNING(...)  TINYROUTE_LOG_IMPL(spdlog::level::warn, __VA_ARGS__)
#define LOG_DEBUG(...)    TINYROUTE_LOG_IMPL(spdlog::level::debug, __VA_ARGS__)
#define LOG_TRACE(...)    TINYROUTE_LOG_IMPL(spdlog::level::trace, __VA_ARGS__)
#define LOG_LEVEL(LEVEL, ...) TINYROUTE_LOG_IMPL(static_cast<spdlog::level::level_enum>(LEVEL), __VA_ARGS__)

#endif

#pragma once

/**
 * @file logger.hpp
 * @brief Logging utilities for Tessera
 */

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <string>

namespace tessera {

/**
 * @brief Logger wrapper for Tessera
 *
 * Worker threads log through the same shared logger; spdlog's *_mt sinks
 * serialize the writes.
 */
class Logger {
public:
    /**
     * @brief Initialize the logging system
     * @param name Logger name
     * @param level Log level (trace, debug, info, warn, error, critical)
     */
    static void init(const std::string& name = "tessera",
                     spdlog::level::level_enum level = spdlog::level::info);

    /**
     * @brief Get the logger instance, initializing it on first use
     *
     * Safe to call while another thread runs init() or shutdown().
     */
    static std::shared_ptr<spdlog::logger> get();

    /**
     * @brief Set the log level
     */
    static void set_level(spdlog::level::level_enum level);

    /**
     * @brief Parse a level name ("trace", "debug", "info", ...)
     * @return The parsed level, or info for unknown names
     */
    static spdlog::level::level_enum parse_level(const std::string& name);

    /**
     * @brief Shutdown the logging system
     */
    static void shutdown();

private:
    static std::shared_ptr<spdlog::logger> logger_;
};

// Convenience macros for logging
#define LOG_TRACE(...)    SPDLOG_LOGGER_TRACE(tessera::Logger::get(), __VA_ARGS__)
#define LOG_DEBUG(...)    SPDLOG_LOGGER_DEBUG(tessera::Logger::get(), __VA_ARGS__)
#define LOG_INFO(...)     SPDLOG_LOGGER_INFO(tessera::Logger::get(), __VA_ARGS__)
#define LOG_WARN(...)     SPDLOG_LOGGER_WARN(tessera::Logger::get(), __VA_ARGS__)
#define LOG_ERROR(...)    SPDLOG_LOGGER_ERROR(tessera::Logger::get(), __VA_ARGS__)
#define LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(tessera::Logger::get(), __VA_ARGS__)

}  // namespace tessera

/**
 * @file Logger.hpp
 * @brief Logging framework wrapper using spdlog
 */

#pragma once

#include "../config/SystemConfig.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <memory>
#include <string>

namespace robot_cell {

class Logger {
public:
    /**
     * Initialize the logging system
     * @param log_file Path to log file (empty = console only)
     * @param level Log level (trace, debug, info, warn, error)
     * @param max_size Maximum file size in bytes (default 10MB)
     * @param max_files Maximum number of rotated files
     */
    static void init(const std::string& log_file = "logs/robot_cell.log",
                     const std::string& level = "info",
                     size_t max_size = 10 * 1024 * 1024,
                     size_t max_files = 5);

    /**
     * Re-initialize from the system configuration (replaces the current logger)
     */
    static void init(const config::LoggingConfig& config);

    /**
     * Drop the current logger so the next init() applies new settings
     */
    static void reset();

    /**
     * Get the logger instance
     */
    static std::shared_ptr<spdlog::logger> get();

private:
    static std::shared_ptr<spdlog::logger> s_logger;
    static bool s_initialized;
};

} // namespace robot_cell

// Convenience macros
#define LOG_TRACE(...) ::robot_cell::Logger::get()->trace(__VA_ARGS__)
#define LOG_DEBUG(...) ::robot_cell::Logger::get()->debug(__VA_ARGS__)
#define LOG_INFO(...)  ::robot_cell::Logger::get()->info(__VA_ARGS__)
#define LOG_WARN(...)  ::robot_cell::Logger::get()->warn(__VA_ARGS__)
#define LOG_ERROR(...) ::robot_cell::Logger::get()->error(__VA_ARGS__)

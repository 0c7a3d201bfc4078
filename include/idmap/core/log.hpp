#pragma once

/// @file log.hpp
/// @brief Logging utilities for idmap

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/fmt/ostr.h>
#include <string>
#include <memory>
#include <optional>

// =============================================================================
// Logging Macros
// =============================================================================

#define IDMAP_LOG_TRACE(...) spdlog::trace(__VA_ARGS__)
#define IDMAP_LOG_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define IDMAP_LOG_INFO(...) spdlog::info(__VA_ARGS__)
#define IDMAP_LOG_WARN(...) spdlog::warn(__VA_ARGS__)
#define IDMAP_LOG_ERROR(...) spdlog::error(__VA_ARGS__)
#define IDMAP_LOG_CRITICAL(...) spdlog::critical(__VA_ARGS__)

namespace idmap_core {

// =============================================================================
// Basic Logging (Inline)
// =============================================================================

/// @brief Initialize the default logger pattern and level
/// Recreates the default logger after shutdown_logging().
inline void init_logging() {
    if (!spdlog::default_logger()) {
        spdlog::set_default_logger(spdlog::stdout_color_mt("idmap"));
    }
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::info);
}

// =============================================================================
// Log Configuration
// =============================================================================

/// Configuration for the logging system
struct LogConfig {
    bool console_enabled = true;
    bool file_enabled = false;
    std::string log_directory;
    std::size_t max_file_size = 10 * 1024 * 1024;  // 10 MB
    std::size_t max_files = 5;
    spdlog::level::level_enum level = spdlog::level::info;
};

/// Configure logging system with full options
/// Loggers created afterwards use the new sinks; existing loggers only pick
/// up the new level.
void configure_logging(const LogConfig& config);

/// Snapshot of the active logging configuration
LogConfig current_log_config();

// =============================================================================
// Named Loggers
// =============================================================================

/// Get or create a named logger
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

/// Get the core module logger ("idmap_core")
std::shared_ptr<spdlog::logger> core_logger();

/// Get the structures module logger ("idmap_structures")
std::shared_ptr<spdlog::logger> structures_logger();

// =============================================================================
// Log Level Management
// =============================================================================

/// Set global log level
void set_global_log_level(spdlog::level::level_enum level);

/// Set log level for specific logger
void set_logger_level(const std::string& name, spdlog::level::level_enum level);

/// Get current global log level
spdlog::level::level_enum get_global_log_level();

/// Parse log level from string
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str);

/// Get log level name
const char* log_level_name(spdlog::level::level_enum level);

// =============================================================================
// Lifecycle
// =============================================================================

/// Flush all loggers
void flush_all_loggers();

/// Drop every named logger and shut spdlog down
/// get_logger() creates fresh loggers afterwards; call init_logging() before
/// using the IDMAP_LOG_* macros again.
void shutdown_logging();

} // namespace idmap_core

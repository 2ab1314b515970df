#pragma once

/// @file log.hpp
/// @brief Logging utilities for onca_engine

#include <spdlog/spdlog.h>
#include <string>
#include <memory>
#include <optional>

namespace onca_core {

// =============================================================================
// Log Configuration
// =============================================================================

/// Sinks and level shared by every logger created through `get_logger`
struct LogConfig {
    bool console_enabled = true;
    /// Rotating `onca.log` in `log_directory`, skipped when the directory is empty
    bool file_enabled = false;
    std::string log_directory;
    std::size_t max_file_size = 10 * 1024 * 1024;
    std::size_t max_files = 5;
    spdlog::level::level_enum level = spdlog::level::info;
};

/// Rebuild the shared sinks and apply them to every logger created through `get_logger`.
/// Loggers the host registered with spdlog itself keep their own sinks. Not safe to call while
/// other threads are logging.
void configure_logging(const LogConfig& config);

// =============================================================================
// Named Loggers
// =============================================================================

/// Get or create a named logger; a logger the host already registered with spdlog is reused
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

/// Get the core module logger
std::shared_ptr<spdlog::logger> core_logger();

// =============================================================================
// Log Level Management
// =============================================================================

/// Set global log level
void set_global_log_level(spdlog::level::level_enum level);

/// Set log level for specific logger
void set_logger_level(const std::string& name, spdlog::level::level_enum level);

/// Get current global log level
spdlog::level::level_enum get_global_log_level();

/// Parse a level name, also accepting `verbose`, `warning`, `err` and `fatal`
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str);

/// Get log level name
const char* log_level_name(spdlog::level::level_enum level);

// =============================================================================
// Lifecycle
// =============================================================================

/// Flush all loggers
void flush_all_loggers();

/// Shutdown logging system
void shutdown_logging();

} // namespace onca_core

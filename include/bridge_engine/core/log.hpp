#pragma once

/// @file log.hpp
/// @brief Logging utilities for bridge_engine

#include <spdlog/spdlog.h>
#include <string>
#include <memory>
#include <optional>
#include <chrono>

namespace bridge_core {

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
void configure_logging(const LogConfig& config);

// =============================================================================
// Named Loggers
// =============================================================================

/// Get or create a named logger
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

/// Catalog loading
std::shared_ptr<spdlog::logger> catalog_logger();

/// Compact codec and native workflow import/export
std::shared_ptr<spdlog::logger> codec_logger();

/// Brief mining and plan emission
std::shared_ptr<spdlog::logger> compiler_logger();

/// Command-line front end
std::shared_ptr<spdlog::logger> cli_logger();

// =============================================================================
// Log Level Management
// =============================================================================

/// Set global log level
void set_global_log_level(spdlog::level::level_enum level);

/// Get current global log level
spdlog::level::level_enum get_global_log_level();

/// Parse log level from string
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str);

/// Get log level name
const char* log_level_name(spdlog::level::level_enum level);

// =============================================================================
// Log Scoping (RAII)
// =============================================================================

/// RAII log scope for function/block tracing
class LogScope {
public:
    LogScope(const std::string& name, const std::string& logger_name = "bridge");
    ~LogScope();

    LogScope(const LogScope&) = delete;
    LogScope& operator=(const LogScope&) = delete;
    LogScope(LogScope&&) = delete;
    LogScope& operator=(LogScope&&) = delete;

private:
    std::string m_name;
    std::shared_ptr<spdlog::logger> m_logger;
    std::chrono::steady_clock::time_point m_start;
};

#define BRIDGE_LOG_SCOPE(name, logger) ::bridge_core::LogScope _log_scope_##__LINE__(name, logger)

// =============================================================================
// Lifecycle
// =============================================================================

/// Flush all loggers
void flush_all_loggers();

/// Shutdown logging system
void shutdown_logging();

} // namespace bridge_core

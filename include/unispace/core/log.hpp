#pragma once

/// @file log.hpp
/// @brief Logging utilities for unispace

#include "fwd.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/fmt/ostr.h>
#include <string>
#include <memory>
#include <optional>
#include <chrono>

// =============================================================================
// Logging Macros
// =============================================================================

#define UNISPACE_LOG_TRACE(...) spdlog::trace(__VA_ARGS__)
#define UNISPACE_LOG_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define UNISPACE_LOG_INFO(...) spdlog::info(__VA_ARGS__)
#define UNISPACE_LOG_WARN(...) spdlog::warn(__VA_ARGS__)
#define UNISPACE_LOG_ERROR(...) spdlog::error(__VA_ARGS__)
#define UNISPACE_LOG_CRITICAL(...) spdlog::critical(__VA_ARGS__)

namespace unispace_core {

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

/// Current logging configuration
LogConfig current_log_config();

// =============================================================================
// Named Loggers
// =============================================================================

/// Get or create a named logger
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

/// Logger for error/config infrastructure
std::shared_ptr<spdlog::logger> core_logger();

/// Logger for the filter lattice
std::shared_ptr<spdlog::logger> filter_logger();

/// Logger for uniform cores, topologies and maps
std::shared_ptr<spdlog::logger> uniform_logger();

/// Logger for the completion engine
std::shared_ptr<spdlog::logger> completion_logger();

/// Logger for model file loading
std::shared_ptr<spdlog::logger> model_logger();

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
// Log Scoping (RAII)
// =============================================================================

/// RAII log scope for function/block tracing
class LogScope {
public:
    LogScope(const std::string& name, const std::string& logger_name = "unispace_core");
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

#define UNISPACE_LOG_SCOPE(name, logger) ::unispace_core::LogScope _log_scope_##__LINE__(name, logger)

// =============================================================================
// Lifecycle
// =============================================================================

/// Flush all loggers
void flush_all_loggers();

/// Shutdown logging system
void shutdown_logging();

} // namespace unispace_core

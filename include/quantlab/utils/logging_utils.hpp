/**
 * @file logging_utils.hpp
 * @brief spdlog setup for the quantlab process
 *
 * stdout carries tool responses, so every log sink writes to stderr or to
 * a file. Component code logs through the spdlog default logger; audit
 * records go to the "quantlab.security" logger; each session gets its own
 * "quantlab.container.<id>" logger sharing the default sinks.
 *
 * @date 2025
 */

#pragma once

#include <spdlog/spdlog.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace quantlab {
namespace utils {

/// Name of the dedicated audit logger
constexpr const char* kSecurityLoggerName = "quantlab.security";

/// Prefix of per-session logger names
constexpr const char* kContainerLoggerPrefix = "quantlab.container.";

/// Default log line layout
constexpr const char* kLogPattern = "[%H:%M:%S] [%^%l%$] %v";

/**
 * @brief Install the process-wide logging sinks
 *
 * Replaces the default logger with one writing to a colored stderr sink
 * and, when @p log_file is set, to a file sink at debug level. Also
 * (re)creates the security logger on the same sinks.
 *
 * @param level Level name ("trace", "debug", "info", "warn", "error", "critical", "off")
 * @param log_file Optional log file path (parent directories are created)
 *
 * @throws spdlog::spdlog_ex if the log file cannot be opened
 */
void ConfigureLogging(const std::string& level,
                      const std::optional<std::filesystem::path>& log_file = std::nullopt);

/**
 * @brief Parse a level name, falling back to info
 */
spdlog::level::level_enum ParseLogLevel(const std::string& level);

/**
 * @brief Get (or create) the audit logger
 */
std::shared_ptr<spdlog::logger> GetSecurityLogger();

/**
 * @brief Get (or create) the logger for one session's sandbox
 *
 * New loggers share the default logger's sinks and level.
 */
std::shared_ptr<spdlog::logger> GetContainerLogger(const std::string& session_id);

/// Unregister a session logger once its session is closed
void DropContainerLogger(const std::string& session_id);

} // namespace utils
} // namespace quantlab

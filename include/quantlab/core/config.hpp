/**
 * @file config.hpp
 * @brief Process configuration
 *
 * Values are layered, later sources winning:
 * 1. built-in defaults
 * 2. JSON config file
 * 3. environment variables
 * 4. command-line flags (applied by main)
 *
 * **Config file example**:
 * @code{.json}
 * {
 *   "manager":  { "max_sessions": 4, "session_timeout_seconds": 1800,
 *                 "cleanup_interval_seconds": 120, "base_port": 8890 },
 *   "session":  { "launcher": "lean", "memory_limit_mb": 4096,
 *                 "default_timeout_seconds": 120, "strategies": ["kernel", "render"] },
 *   "security": { "max_code_bytes": 20000 },
 *   "logging":  { "level": "debug", "file": "/var/log/quantlab.log" },
 *   "runtime":  { "engine": "docker", "lean_binary": "lean" }
 * }
 * @endcode
 *
 * @date 2025
 */

#pragma once

#include "quantlab/core/session_manager.hpp"
#include "quantlab/security/code_guard.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace quantlab {
namespace core {

/**
 * @struct QuantlabConfig
 * @brief Everything main needs to wire the process together
 */
struct QuantlabConfig {
    ManagerConfig manager;                          ///< Pool settings and session defaults
    security::GuardConfig guard;                    ///< Payload limits
    std::string log_level{"info"};
    std::optional<std::filesystem::path> log_file;
    std::string container_engine{"docker"};         ///< "docker" or "podman"
    std::string lean_binary{"lean"};
};

/// Lookup used for environment variables (returns nullptr when unset)
using EnvLookup = std::function<const char*(const char*)>;

/**
 * @brief Apply a parsed JSON document on top of @p config
 *
 * Unknown keys are ignored. Wrongly typed values throw.
 *
 * @throws std::runtime_error on invalid values
 */
void ApplyJson(QuantlabConfig& config, const nlohmann::json& j);

/**
 * @brief Load a JSON config file on top of @p config
 * @throws std::runtime_error if the file cannot be read or parsed
 */
void LoadConfigFile(QuantlabConfig& config, const std::filesystem::path& path);

/**
 * @brief Apply environment overrides
 *
 * Recognized variables:
 * - QUANTBOOK_DOCKER_PORT         base port
 * - QUANTCONNECT_ORGANIZATION_ID  organization for `lean init`
 * - QUANTLAB_MAX_SESSIONS         pool capacity
 * - QUANTLAB_SESSION_TIMEOUT      idle timeout in seconds
 * - QUANTLAB_LOG_LEVEL            log level name
 *
 * @param lookup Environment accessor (defaults to std::getenv)
 * @throws std::runtime_error on non-numeric values for numeric settings
 */
void ApplyEnvironment(QuantlabConfig& config, const EnvLookup& lookup = nullptr);

/**
 * @brief Reject inconsistent settings
 * @throws std::runtime_error describing the first problem found
 */
void ValidateConfig(const QuantlabConfig& config);

} // namespace core
} // namespace quantlab

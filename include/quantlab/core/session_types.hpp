/**
 * @file session_types.hpp
 * @brief Shared types for research sessions and their manager
 *
 * Defines the session state machine states, the error taxonomy, the
 * execution result returned to callers, per-session creation parameters
 * and the exception hierarchy.
 *
 * @date 2025
 */

#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace quantlab {
namespace core {

/**
 * @enum SessionState
 * @brief Research session lifecycle
 *
 * ```
 * UNINITIALIZED -> INITIALIZING -> READY <-> EXECUTING -> READY | ERROR
 * any non-terminal state -> CLOSED (terminal)
 * ```
 */
enum class SessionState {
    UNINITIALIZED,   ///< Constructed, no sandbox yet
    INITIALIZING,    ///< Provisioning in progress
    READY,           ///< Accepting executions
    EXECUTING,       ///< An execution is running
    ERROR,           ///< Sandbox became unreachable
    CLOSED           ///< Torn down (terminal)
};

/**
 * @enum ErrorKind
 * @brief Classification of a failed operation
 */
enum class ErrorKind {
    NONE,
    PROVISIONING,         ///< Sandbox could not be provisioned
    SANDBOX_NOT_FOUND,    ///< Sandbox could not be located or was lost
    EXECUTION_TIMEOUT,    ///< Every attempt ran out of time
    ARTIFACT_PARSE,       ///< Execution log artifact is corrupted
    CAPACITY_EXCEEDED,    ///< Session pool is full
    SECURITY_VIOLATION,   ///< Payload rejected by the security gate
    CODE_ERROR,           ///< User code raised an exception
    EXECUTION_FAILED      ///< Every strategy failed for another reason
};

/**
 * @enum ResultStatus
 * @brief Top-level outcome of an execution
 */
enum class ResultStatus {
    SUCCESS,
    ERROR
};

/**
 * @enum LauncherKind
 * @brief How a session's sandbox is started
 */
enum class LauncherKind {
    LEAN_CLI,           ///< `lean research` via the provisioning tool
    DIRECT_CONTAINER    ///< Container started directly through the runtime
};

/**
 * @struct ExecutionResult
 * @brief Outcome of ResearchSession::Execute()
 *
 * Execution never throws; every failure is described here.
 */
struct ExecutionResult {
    ResultStatus status{ResultStatus::SUCCESS};
    std::string output;                    ///< Captured standard output
    std::optional<std::string> error;      ///< Human-readable failure description
    std::string session_id;
    std::optional<bool> timeout;           ///< Set to true when the last attempt timed out
    std::optional<int> exit_code;          ///< Exit status of the last attempt, when known
    ErrorKind error_kind{ErrorKind::NONE};
    std::string strategy;                  ///< Strategy that produced the result

    bool IsSuccess() const { return status == ResultStatus::SUCCESS; }

    /// Render as the JSON object returned by the tool layer
    nlohmann::json ToJson() const;

    /// Build an error result without output
    static ExecutionResult Failure(const std::string& session_id,
                                   ErrorKind kind,
                                   const std::string& message);
};

/**
 * @struct SessionParams
 * @brief Per-session creation parameters
 */
struct SessionParams {
    std::optional<std::filesystem::path> workspace;   ///< Caller-supplied workspace (kept on close)
    std::optional<int> port;                          ///< Host port for the notebook server
    LauncherKind launcher{LauncherKind::LEAN_CLI};
    std::string image{"quantconnect/research:latest"};
    std::size_t memory_limit_mb{2048};
    double cpu_limit{1.0};
    std::chrono::milliseconds default_timeout{std::chrono::seconds(300)};
    std::chrono::milliseconds attempt_overhead{std::chrono::seconds(10)};   ///< Added to each attempt's budget
    std::vector<std::string> strategies{"kernel", "interpreter", "render"};
    std::optional<std::string> organization_id;
    std::chrono::milliseconds relocation_delay{std::chrono::seconds(2)};   ///< Pause before locating a launched sandbox
};

/**
 * @struct SessionInfo
 * @brief Snapshot of a session for listings
 */
struct SessionInfo {
    std::string session_id;
    SessionState state{SessionState::UNINITIALIZED};
    std::string created_at;   ///< ISO-8601 UTC
    std::string last_used;    ///< ISO-8601 UTC
    bool initialized{false};
    std::string workspace_dir;
    int port{0};
    std::optional<std::string> sandbox_ref;

    nlohmann::json ToJson() const;
};

/***************************************************************************
 * Exceptions
 ***************************************************************************/

/// Base class for session-level failures
class SessionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Session pool is full and nothing could be evicted
class CapacityExceededError : public SessionError {
public:
    using SessionError::SessionError;
};

/// Sandbox could not be provisioned
class ProvisioningError : public SessionError {
public:
    using SessionError::SessionError;
};

/// Execution log artifact could not be parsed
class ArtifactParseError : public SessionError {
public:
    using SessionError::SessionError;
};

/***************************************************************************
 * Conversions
 ***************************************************************************/

std::string StateToString(SessionState state);
std::string ErrorKindToString(ErrorKind kind);
std::string LauncherToString(LauncherKind launcher);

/**
 * @brief Parse a launcher name ("lean" / "lean-cli" / "direct" / "container")
 * @throws std::invalid_argument on unknown names
 */
LauncherKind ParseLauncher(const std::string& name);

} // namespace core
} // namespace quantlab

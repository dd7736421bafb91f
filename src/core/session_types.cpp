/**
 * @file session_types.cpp
 * @brief Enum names and ExecutionResult JSON rendering
 *
 * @date 2025
 */

#include "quantlab/core/session_types.hpp"
#include "quantlab/utils/string_utils.hpp"

namespace quantlab {
namespace core {

using json = nlohmann::json;

// ============================================================================
// EXECUTION RESULT
// ============================================================================

json ExecutionResult::ToJson() const {
    json j;
    j["status"] = IsSuccess() ? "success" : "error";
    j["output"] = output;
    j["session_id"] = session_id;

    if (error) {
        j["error"] = *error;
        j["error_kind"] = ErrorKindToString(error_kind);
    }
    if (timeout) {
        j["timeout"] = *timeout;
    }
    if (exit_code) {
        j["exit_code"] = *exit_code;
    }
    if (!strategy.empty()) {
        j["execution_method"] = strategy;
    }

    return j;
}

ExecutionResult ExecutionResult::Failure(const std::string& session_id,
                                         ErrorKind kind,
                                         const std::string& message) {
    ExecutionResult result;
    result.status = ResultStatus::ERROR;
    result.session_id = session_id;
    result.error_kind = kind;
    result.error = message;
    return result;
}

// ============================================================================
// SESSION INFO
// ============================================================================

json SessionInfo::ToJson() const {
    json j = {
        {"session_id", session_id},
        {"state", StateToString(state)},
        {"created_at", created_at},
        {"last_used", last_used},
        {"initialized", initialized},
        {"workspace_dir", workspace_dir},
        {"port", port}
    };
    if (sandbox_ref) {
        j["container_id"] = *sandbox_ref;
    } else {
        j["container_id"] = nullptr;
    }
    return j;
}

// ============================================================================
// CONVERSIONS
// ============================================================================

std::string StateToString(SessionState state) {
    switch (state) {
        case SessionState::UNINITIALIZED: return "uninitialized";
        case SessionState::INITIALIZING:  return "initializing";
        case SessionState::READY:         return "ready";
        case SessionState::EXECUTING:     return "executing";
        case SessionState::ERROR:         return "error";
        case SessionState::CLOSED:        return "closed";
        default: return "unknown";
    }
}

std::string ErrorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE:               return "none";
        case ErrorKind::PROVISIONING:       return "provisioning";
        case ErrorKind::SANDBOX_NOT_FOUND:  return "sandbox_not_found";
        case ErrorKind::EXECUTION_TIMEOUT:  return "execution_timeout";
        case ErrorKind::ARTIFACT_PARSE:     return "artifact_parse";
        case ErrorKind::CAPACITY_EXCEEDED:  return "capacity_exceeded";
        case ErrorKind::SECURITY_VIOLATION: return "security_violation";
        case ErrorKind::CODE_ERROR:         return "code_error";
        case ErrorKind::EXECUTION_FAILED:   return "execution_failed";
        default: return "unknown";
    }
}

std::string LauncherToString(LauncherKind launcher) {
    switch (launcher) {
        case LauncherKind::LEAN_CLI:         return "lean";
        case LauncherKind::DIRECT_CONTAINER: return "direct";
        default: return "unknown";
    }
}

LauncherKind ParseLauncher(const std::string& name) {
    std::string lowered = utils::StringUtils::ToLower(utils::StringUtils::Trim(name));
    if (lowered == "lean" || lowered == "lean-cli" || lowered == "lean_cli") {
        return LauncherKind::LEAN_CLI;
    }
    if (lowered == "direct" || lowered == "container" || lowered == "docker") {
        return LauncherKind::DIRECT_CONTAINER;
    }
    throw std::invalid_argument("Unknown launcher: " + name);
}

} // namespace core
} // namespace quantlab

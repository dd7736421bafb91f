/**
 * @file research_session.hpp
 * @brief One research sandbox and the protocol for running code in it
 *
 * A ResearchSession owns a workspace directory and the container that
 * serves it. It provisions the container (through the LEAN CLI or directly
 * through the container runtime), finds it again when the launcher does
 * not report it, and executes submitted code by appending it to the
 * session notebook and running the newest cell with the first execution
 * strategy that works.
 *
 * **State machine**:
 * ```
 * UNINITIALIZED -> INITIALIZING -> READY <-> EXECUTING -> READY | ERROR
 *                        any non-terminal state -> CLOSED
 * ```
 *
 * **Sandbox location order** (first hit wins):
 * 1. container name printed by the launcher
 * 2. container labelled quantlab.session_id=<id>
 * 3. container publishing the session's host port
 *
 * @date 2025
 */

#pragma once

#include "quantlab/core/session_types.hpp"
#include "quantlab/sandbox/execution_strategy.hpp"
#include "quantlab/sandbox/lean_cli.hpp"
#include "quantlab/security/code_guard.hpp"
#include "quantlab/utils/container_utils.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace spdlog {
class logger;
}

namespace quantlab {
namespace core {

/// Label carrying the owning session id on every sandbox container
constexpr const char* kSessionLabel = "quantlab.session_id";

/// Label carrying the session creation time (ISO-8601)
constexpr const char* kCreatedAtLabel = "quantlab.created_at";

/// Notebook server port inside the sandbox
constexpr int kSandboxNotebookPort = 8888;

/**
 * @struct SessionDependencies
 * @brief External collaborators shared by every session
 */
struct SessionDependencies {
    std::shared_ptr<utils::ContainerRuntime> runtime;
    std::shared_ptr<sandbox::ProvisioningTool> provisioning;   ///< Required for LEAN_CLI sessions
    std::shared_ptr<security::AuditSink> audit;                ///< Optional
    security::GuardConfig guard;
};

/**
 * @class ResearchSession
 * @brief Owns one sandbox; thread-safe
 *
 * Executions on one session are serialized. Close() may be called from any
 * thread at any time and never throws.
 *
 * **Usage Example**:
 * @code
 * auto session = std::make_shared<ResearchSession>("default", SessionParams{}, deps);
 * session->Initialize();
 * auto result = session->Execute("print(1 + 1)");
 * // result.output == "2"
 * session->Close("done");
 * @endcode
 */
class ResearchSession {
public:
    /**
     * @brief Construct session (no sandbox is started yet)
     *
     * Creates a temporary workspace ("qc_research_<id>_XXXXXX") when
     * params.workspace is not set.
     *
     * @throws std::invalid_argument if a required collaborator is missing
     * @throws std::runtime_error if the workspace cannot be created
     */
    ResearchSession(std::string session_id, SessionParams params, SessionDependencies deps);

    /// Closes the session if still open
    ~ResearchSession();

    ResearchSession(const ResearchSession&) = delete;
    ResearchSession& operator=(const ResearchSession&) = delete;

    /***************************************************************************
     * Lifecycle
     ***************************************************************************/

    /**
     * @brief Provision and start the sandbox
     *
     * No-op unless the session is UNINITIALIZED. On failure the session is
     * closed with reason "initialization_failed".
     *
     * @throws ProvisioningError if the sandbox cannot be provisioned
     */
    void Initialize();

    /**
     * @brief Execute research code in the sandbox
     * @param code Python source
     * @param timeout Per-attempt timeout (defaults to params.default_timeout)
     * @return Result; never throws
     */
    ExecutionResult Execute(const std::string& code,
                            std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /**
     * @brief Stop the sandbox and release the workspace
     *
     * Stop gets a 10 s grace period, then the container is killed. Owned
     * workspaces are deleted. Idempotent; the first reason is the one
     * audited.
     */
    void Close(const std::string& reason = "normal") noexcept;

    /**
     * @brief Try to find the sandbox container again
     * @return true if sandbox_ref is set afterwards
     */
    bool LocateSandbox();

    /// Refresh last_used (never moves it backwards)
    void Touch();

    /***************************************************************************
     * Queries
     ***************************************************************************/

    /// now - last_used > max_idle
    bool IsExpired(std::chrono::milliseconds max_idle) const;
    bool IsExpired(std::chrono::milliseconds max_idle,
                   std::chrono::steady_clock::time_point now) const;

    const std::string& GetId() const { return session_id_; }
    SessionState GetState() const;
    bool IsInitialized() const;
    std::optional<std::string> GetSandboxRef() const;
    int GetPort() const { return port_; }
    std::string GetEndpoint() const;
    const std::filesystem::path& GetWorkspace() const { return workspace_; }
    bool OwnsWorkspace() const { return owns_workspace_; }
    std::chrono::steady_clock::time_point GetCreatedAt() const;
    std::chrono::steady_clock::time_point GetLastUsed() const;
    const SessionParams& GetParams() const { return params_; }
    SessionInfo GetInfo() const;

    /// Host path of the session notebook
    std::filesystem::path GetNotebookPath() const;

    /**
     * @brief Extract a container name from launcher output
     *
     * Looks at lines mentioning a container that was started/running and
     * takes a quoted name, else the token after "container".
     */
    static std::optional<std::string> ParseLaunchOutput(const std::string& output);

private:
    // Provisioning
    void ProvisionWithLeanCli();
    void ProvisionDirectContainer();
    void EnsureScaffold();
    std::filesystem::path EnsureResearchNotebook();
    std::map<std::string, std::string> SessionLabels() const;

    // Location
    std::optional<std::string> LocateFromLaunchOutput();
    std::optional<std::string> LocateByLabel();
    std::optional<std::string> LocateByPort();
    void SetSandboxRef(const std::string& ref);

    // Execution
    ExecutionResult RunStrategies(const sandbox::ExecutionContext& context);
    std::optional<sandbox::AttemptResult> RunAttempt(std::shared_ptr<sandbox::ExecutionStrategy> strategy,
                                                     const sandbox::ExecutionContext& context,
                                                     std::chrono::milliseconds budget);

    /// Move to @p next unless CLOSED; returns false if the session is closed
    bool TransitionTo(SessionState next);

    void ReleaseWorkspace();

    const std::string session_id_;
    const SessionParams params_;
    SessionDependencies deps_;
    security::CodeGuard guard_;
    std::vector<std::shared_ptr<sandbox::ExecutionStrategy>> strategies_;
    std::shared_ptr<spdlog::logger> logger_;

    std::filesystem::path workspace_;
    bool owns_workspace_{false};
    int port_{kSandboxNotebookPort};

    // Guarded by state_mutex_
    mutable std::mutex state_mutex_;
    SessionState state_{SessionState::UNINITIALIZED};
    std::optional<std::string> sandbox_ref_;
    std::string launch_output_;
    bool creation_audited_{false};
    std::chrono::steady_clock::time_point created_at_;
    std::chrono::steady_clock::time_point last_used_;
    std::chrono::system_clock::time_point created_wall_;
    std::chrono::system_clock::time_point last_used_wall_;

    std::mutex lifecycle_mutex_;   ///< Serializes Initialize() and Close()
    std::mutex execution_mutex_;   ///< Serializes Execute()
    std::atomic<bool> closed_{false};
};

} // namespace core
} // namespace quantlab

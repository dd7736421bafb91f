/**
 * @file session_manager.hpp
 * @brief Bounded pool of research sessions keyed by caller-chosen ids
 *
 * The manager is the only place sessions are created and destroyed. It
 * enforces the pool capacity, hands out existing sessions by id, and runs
 * a background sweep that closes sessions idle for longer than the
 * configured timeout.
 *
 * @date 2025
 */

#pragma once

#include "quantlab/core/research_session.hpp"
#include "quantlab/core/session_types.hpp"

#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace quantlab {
namespace core {

/**
 * @struct ManagerConfig
 * @brief Pool limits and sweep cadence
 */
struct ManagerConfig {
    std::size_t max_sessions{10};                                       ///< Pool capacity
    std::chrono::milliseconds session_timeout{std::chrono::hours(1)};   ///< Idle time before eviction
    std::chrono::milliseconds cleanup_interval{std::chrono::minutes(5)};///< Sweep period
    int base_port{8888};                                                ///< First host port handed out
    SessionParams default_params;                                       ///< Used when the caller passes none
};

/**
 * @struct SessionCount
 * @brief Capacity snapshot
 */
struct SessionCount {
    std::size_t active{0};
    std::size_t max{0};
    std::size_t available{0};
};

/**
 * @class SessionManager
 * @brief Owns every live ResearchSession
 *
 * Thread-safe. The registry lock is never held while a session is being
 * provisioned, executed or closed.
 *
 * **Usage Example**:
 * @code
 * SessionManager manager(ManagerConfig{}, deps);
 * manager.Start();
 *
 * auto session = manager.GetOrCreateSession("default");
 * auto result = session->Execute("print('hello')");
 *
 * manager.CloseSession("default", "user_request");
 * manager.Stop();
 * @endcode
 */
class SessionManager {
public:
    SessionManager(ManagerConfig config, SessionDependencies deps);

    /// Stops the sweep and closes every session
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    /***************************************************************************
     * Lifecycle
     ***************************************************************************/

    /// Start the background sweep (no-op if running)
    void Start();

    /// Stop the sweep and close every session (no-op if not running)
    void Stop();

    bool IsRunning() const;

    /***************************************************************************
     * Sessions
     ***************************************************************************/

    /**
     * @brief Return the session for @p session_id, creating it if needed
     *
     * Existing sessions are touched and returned as-is (@p params is
     * ignored). New sessions are initialized before they are registered;
     * concurrent calls for the same id wait for the first creation.
     *
     * @param session_id Caller-chosen id
     * @param params Creation parameters (defaults from ManagerConfig)
     *
     * @throws CapacityExceededError if the pool is full after a sweep
     * @throws ProvisioningError if the session cannot be initialized
     */
    std::shared_ptr<ResearchSession> GetOrCreateSession(const std::string& session_id,
                                                        std::optional<SessionParams> params = std::nullopt);

    /**
     * @brief Look up a session without creating it
     * @return Session (touched), or nullptr
     */
    std::shared_ptr<ResearchSession> GetSession(const std::string& session_id);

    /**
     * @brief Remove and close a session
     * @return false if no such session
     */
    bool CloseSession(const std::string& session_id, const std::string& reason = "closed");

    /// Close every registered session
    void CleanupAllSessions();

    /**
     * @brief Run one eviction pass
     * @return Number of sessions closed
     */
    std::size_t CleanupExpiredSessions();

    std::vector<SessionInfo> ListSessions() const;
    SessionCount GetSessionCount() const;

    const ManagerConfig& GetConfig() const { return config_; }

private:
    void CleanupLoop();

    /// Lowest port >= base_port not used by a live or pending session; mutex_ must be held
    int AllocatePortLocked() const;

    const ManagerConfig config_;
    SessionDependencies deps_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<ResearchSession>> sessions_;
    std::map<std::string, int> pending_;   ///< Ids being created -> reserved port
    std::condition_variable pending_cv_;

    bool running_{false};
    bool stop_requested_{false};
    std::condition_variable stop_cv_;
    std::thread cleanup_thread_;
};

} // namespace core
} // namespace quantlab

/**
 * @file session_manager.cpp
 * @brief Session registry, capacity control and the expiry sweep
 *
 * Provisioning never happens under mutex_: a creating thread reserves the
 * id in pending_ (which also counts against capacity and holds the port),
 * drops the lock, initializes the session, then publishes it. Threads that
 * ask for the same id meanwhile wait on pending_cv_.
 *
 * @date 2025
 */

#include "quantlab/core/session_manager.hpp"

#include <spdlog/spdlog.h>

#include <set>

namespace quantlab {
namespace core {

SessionManager::SessionManager(ManagerConfig config, SessionDependencies deps)
    : config_(std::move(config)), deps_(std::move(deps)) {
    spdlog::info("Session manager initialized (max_sessions: {}, timeout: {}s)",
                 config_.max_sessions,
                 std::chrono::duration_cast<std::chrono::seconds>(config_.session_timeout).count());
}

SessionManager::~SessionManager() {
    Stop();
}

// ============================================================================
// LIFECYCLE
// ============================================================================

void SessionManager::Start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        return;
    }

    running_ = true;
    stop_requested_ = false;
    cleanup_thread_ = std::thread(&SessionManager::CleanupLoop, this);
    spdlog::info("Session manager started");
}

void SessionManager::Stop() {
    bool was_running = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        was_running = running_;
        running_ = false;
        stop_requested_ = true;
    }
    stop_cv_.notify_all();

    if (cleanup_thread_.joinable()) {
        cleanup_thread_.join();
    }

    // Sessions are closed even if the sweep thread never ran
    CleanupAllSessions();
    if (was_running) {
        spdlog::info("Session manager stopped");
    }
}

bool SessionManager::IsRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

void SessionManager::CleanupLoop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stop_requested_) {
        if (stop_cv_.wait_for(lock, config_.cleanup_interval, [this]() { return stop_requested_; })) {
            break;
        }

        lock.unlock();
        try {
            std::size_t closed = CleanupExpiredSessions();
            if (closed > 0) {
                spdlog::info("Cleaned up {} expired session(s)", closed);
            }
        }
        catch (const std::exception& e) {
            spdlog::error("Error in cleanup loop: {}", e.what());
        }
        lock.lock();
    }
}

// ============================================================================
// SESSION ACCESS
// ============================================================================

std::shared_ptr<ResearchSession> SessionManager::GetOrCreateSession(const std::string& session_id,
                                                                    std::optional<SessionParams> params) {
    std::unique_lock<std::mutex> lock(mutex_);
    bool swept = false;

    for (;;) {
        auto it = sessions_.find(session_id);
        if (it != sessions_.end()) {
            it->second->Touch();
            return it->second;
        }

        if (pending_.count(session_id) > 0) {
            pending_cv_.wait(lock);
            continue;
        }

        if (sessions_.size() + pending_.size() < config_.max_sessions) {
            break;
        }

        if (swept) {
            throw CapacityExceededError("Maximum number of sessions (" +
                                        std::to_string(config_.max_sessions) + ") reached");
        }

        lock.unlock();
        CleanupExpiredSessions();
        lock.lock();
        swept = true;
    }

    SessionParams session_params = params.value_or(config_.default_params);
    if (!session_params.port) {
        session_params.port = AllocatePortLocked();
    }
    pending_[session_id] = *session_params.port;
    lock.unlock();

    auto release_pending = [this, &session_id]() {
        {
            std::lock_guard<std::mutex> guard(mutex_);
            pending_.erase(session_id);
        }
        pending_cv_.notify_all();
    };

    std::shared_ptr<ResearchSession> session;
    try {
        session = std::make_shared<ResearchSession>(session_id, session_params, deps_);
        session->Initialize();
    }
    catch (const ProvisioningError& e) {
        release_pending();
        spdlog::error("Failed to create session {}: {}", session_id, e.what());
        throw;
    }
    catch (const std::exception& e) {
        release_pending();
        spdlog::error("Failed to create session {}: {}", session_id, e.what());
        throw ProvisioningError(std::string("Failed to create session ") + session_id + ": " + e.what());
    }

    {
        std::lock_guard<std::mutex> guard(mutex_);
        pending_.erase(session_id);
        sessions_[session_id] = session;
    }
    pending_cv_.notify_all();

    spdlog::info("Created research session {} on port {}", session_id, session->GetPort());
    return session;
}

std::shared_ptr<ResearchSession> SessionManager::GetSession(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return nullptr;
    }
    it->second->Touch();
    return it->second;
}

bool SessionManager::CloseSession(const std::string& session_id, const std::string& reason) {
    std::shared_ptr<ResearchSession> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            return false;
        }
        session = std::move(it->second);
        sessions_.erase(it);
    }

    session->Close(reason);
    spdlog::info("Closed research session {} ({})", session_id, reason);
    return true;
}

void SessionManager::CleanupAllSessions() {
    std::map<std::string, std::shared_ptr<ResearchSession>> sessions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions.swap(sessions_);
    }

    for (auto& [id, session] : sessions) {
        session->Close("cleanup");
    }

    if (!sessions.empty()) {
        spdlog::info("Cleaned up {} session(s)", sessions.size());
    }
}

std::size_t SessionManager::CleanupExpiredSessions() {
    std::vector<std::shared_ptr<ResearchSession>> expired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = std::chrono::steady_clock::now();
        for (auto it = sessions_.begin(); it != sessions_.end();) {
            if (it->second->IsExpired(config_.session_timeout, now)) {
                expired.push_back(std::move(it->second));
                it = sessions_.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (auto& session : expired) {
        spdlog::info("Session {} expired, closing", session->GetId());
        session->Close("expired");
    }

    return expired.size();
}

// ============================================================================
// REPORTING
// ============================================================================

std::vector<SessionInfo> SessionManager::ListSessions() const {
    std::vector<std::shared_ptr<ResearchSession>> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot.reserve(sessions_.size());
        for (const auto& [id, session] : sessions_) {
            snapshot.push_back(session);
        }
    }

    std::vector<SessionInfo> infos;
    infos.reserve(snapshot.size());
    for (const auto& session : snapshot) {
        infos.push_back(session->GetInfo());
    }
    return infos;
}

SessionCount SessionManager::GetSessionCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    SessionCount count;
    count.active = sessions_.size();
    count.max = config_.max_sessions;
    count.available = config_.max_sessions > sessions_.size() ? config_.max_sessions - sessions_.size() : 0;
    return count;
}

int SessionManager::AllocatePortLocked() const {
    std::set<int> used;
    for (const auto& [id, session] : sessions_) {
        used.insert(session->GetPort());
    }
    for (const auto& [id, port] : pending_) {
        used.insert(port);
    }

    int port = config_.base_port;
    while (used.count(port) > 0) {
        ++port;
    }
    return port;
}

} // namespace core
} // namespace quantlab
